#ifndef CHRONICLE_STORE_SQLITE_STORE_HPP
#define CHRONICLE_STORE_SQLITE_STORE_HPP

#include <chronicle/store/document_store.hpp>

namespace chronicle {

// A sqlite_store keeps its collections in an SQLite database file. Each
// document is stored as a JSON string in a single table that's keyed by
// collection name and document ID.
//
// Sessions are SQLite transactions. Since the store has a single connection,
// only one session can be open at a time, and while it's open, every
// operation must be performed through it.
//
// Any failure of the underlying database is reported as a store_failure.
// The store is internally protected by a mutex, so it can be used
// concurrently from multiple threads.

struct sqlite_store_config
{
    // the path to the database file ("" or ":memory:" for an in-memory
    // database)
    string path;
};

// This provides the path to the database file (in store_failure exceptions).
CHRONICLE_DEFINE_ERROR_INFO(string, database_path)

struct sqlite_store_impl;

struct sqlite_store : document_store
{
    sqlite_store(sqlite_store_config const& config);

    ~sqlite_store();

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

 private:
    std::shared_ptr<sqlite_store_impl> impl_;
};

} // namespace chronicle

#endif
