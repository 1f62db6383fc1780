#ifndef CHRONICLE_HISTORY_REGISTRY_HPP
#define CHRONICLE_HISTORY_REGISTRY_HPP

#include <map>
#include <memory>

#include <chronicle/history/tracker.hpp>

namespace chronicle {

// HISTORY REGISTRY - A history_registry owns the trackers for a set of
// document types that share a store. Types are registered and unregistered
// explicitly. Trackers stay valid until their type is unregistered (or the
// registry is destroyed).

// This is thrown when registering a type name that's already registered.
CHRONICLE_DEFINE_EXCEPTION(duplicate_registration)
// (Both this and unregistered_type provide type_name_info.)

struct history_registry
{
    history_registry(document_store& store);

    history_tracker&
    register_type(history_options options);

    void
    unregister_type(string const& name);

    bool
    is_registered(string const& name) const;

    history_tracker&
    tracker(string const& name) const;

    // the names of the registered types (in alphabetical order)
    std::vector<string>
    registered_types() const;

 private:
    document_store* store_;
    std::map<string, std::unique_ptr<history_tracker>> trackers_;
};

} // namespace chronicle

#endif
