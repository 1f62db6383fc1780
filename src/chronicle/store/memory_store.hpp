#ifndef CHRONICLE_STORE_MEMORY_STORE_HPP
#define CHRONICLE_STORE_MEMORY_STORE_HPP

#include <chronicle/store/document_store.hpp>

namespace chronicle {

// A memory_store keeps its collections in memory. It's mainly intended for
// testing and for hosts that manage persistence themselves.
//
// Sessions work on a private copy of the store's contents, taken when the
// session begins. Committing a session publishes only the collections that
// it wrote to, replacing those collections wholesale. Writes made elsewhere
// to other collections survive the commit, but within a collection that the
// session wrote to, the last session to commit wins.
//
// The store is internally protected by a mutex, so it can be used
// concurrently from multiple threads.

struct memory_store_impl;

struct memory_store : document_store
{
    memory_store();

    ~memory_store();

    cppcoro::task<optional<dynamic_map>>
    find_one(
        string collection,
        document_query query,
        store_session* session = nullptr) override;

    cppcoro::task<std::vector<dynamic_map>>
    find_many(
        string collection,
        document_query query,
        store_session* session = nullptr) override;

    cppcoro::task<>
    insert(
        string collection,
        dynamic_map document,
        store_session* session = nullptr) override;

    cppcoro::task<>
    save(
        string collection,
        dynamic_map document,
        store_session* session = nullptr) override;

    cppcoro::task<update_result>
    update_one(
        string collection,
        document_query query,
        update_expression update,
        update_options options = update_options(),
        store_session* session = nullptr) override;

    cppcoro::task<update_result>
    update_many(
        string collection,
        document_query query,
        update_expression update,
        update_options options = update_options(),
        store_session* session = nullptr) override;

    cppcoro::task<integer>
    delete_many(
        string collection,
        document_query query,
        store_session* session = nullptr) override;

    std::unique_ptr<store_session>
    begin_session() override;

    // Get the number of documents currently in :collection (outside of any
    // session).
    size_t
    count(string const& collection);

 private:
    std::shared_ptr<memory_store_impl> impl_;
};

} // namespace chronicle

#endif
