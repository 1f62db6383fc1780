#include <chronicle/history/registry.hpp>

#include <chronicle/core/logging.hpp>

namespace chronicle {

history_registry::history_registry(document_store& store) : store_(&store)
{
}

history_tracker&
history_registry::register_type(history_options options)
{
    auto name = options.name;
    if (trackers_.find(name) != trackers_.end())
        CHRONICLE_THROW(duplicate_registration() << type_name_info(name));
    auto& tracker = trackers_[name];
    tracker = std::make_unique<history_tracker>(*store_, std::move(options));
    get_logger()->debug(
        "registered {} (history in {})",
        name,
        get_history_collection(tracker->options()));
    return *tracker;
}

void
history_registry::unregister_type(string const& name)
{
    if (trackers_.erase(name) == 0)
        CHRONICLE_THROW(unregistered_type() << type_name_info(name));
}

bool
history_registry::is_registered(string const& name) const
{
    return trackers_.find(name) != trackers_.end();
}

history_tracker&
history_registry::tracker(string const& name) const
{
    auto tracker = trackers_.find(name);
    if (tracker == trackers_.end())
        CHRONICLE_THROW(unregistered_type() << type_name_info(name));
    return *tracker->second;
}

std::vector<string>
history_registry::registered_types() const
{
    return map_to_vector(
        [](auto const& entry) { return entry.first; }, trackers_);
}

} // namespace chronicle
