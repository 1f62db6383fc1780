#ifndef CHRONICLE_STORE_DOCUMENT_STORE_HPP
#define CHRONICLE_STORE_DOCUMENT_STORE_HPP

#include <memory>
#include <vector>

#include <cppcoro/task.hpp>

#include <chronicle/core/type_interfaces.hpp>

namespace chronicle {

// DOCUMENT STORES - A document store holds named collections of documents.
// Documents are maps with an "_id" field holding an object_id.
//
// Queries are condition maps. Each field maps a (possibly dotted) path to
// either a value, which the document's value must equal, or a map of
// operators ($eq, $ne, $in, $exists). A query that's an empty map matches
// every document.
//
// Updates are maps of direct field assignments and/or the operators $set,
// $unset, $inc, $push, $pull and $setOnInsert.
//
// All store operations are asynchronous. They all accept an optional session
// so that a sequence of operations can be committed or aborted as a unit.

typedef dynamic_map document_query;
typedef dynamic_map update_expression;

// This exception indicates a failure in the underlying storage (or an attempt
// to use it incorrectly).
CHRONICLE_DEFINE_EXCEPTION(store_failure)
// This provides the name of the collection that was being accessed.
CHRONICLE_DEFINE_ERROR_INFO(string, collection_name)
// This exception also provides internal_error_message_info.

struct update_options
{
    // If no document matches the query, insert one that's built from the
    // query's equality conditions and the update.
    bool upsert = false;
};

struct update_result
{
    // the number of documents that matched the query
    integer matched_count = 0;

    // the number of documents that were actually changed
    integer modified_count = 0;

    // the number of documents that were inserted because of :upsert
    integer upserted_count = 0;

    // the ID of the inserted document (if any)
    optional<object_id> upserted_id;

    // Stores that can't report the counts above set this to false.
    bool counts_reported = true;
};

// A store_session groups operations so that they take effect together.
// If a session is destroyed without being committed, it's aborted.
struct store_session
{
    virtual ~store_session()
    {
    }

    virtual void
    commit() = 0;

    virtual void
    abort() = 0;
};

struct document_store
{
    virtual ~document_store()
    {
    }

    // Find the first document in :collection that matches :query.
    virtual cppcoro::task<optional<dynamic_map>>
    find_one(
        string collection,
        document_query query,
        store_session* session = nullptr)
        = 0;

    // Find all documents in :collection that match :query (in insertion
    // order).
    virtual cppcoro::task<std::vector<dynamic_map>>
    find_many(
        string collection,
        document_query query,
        store_session* session = nullptr)
        = 0;

    // Insert a new document. If the document doesn't have an _id, one is
    // assigned.
    virtual cppcoro::task<>
    insert(
        string collection,
        dynamic_map document,
        store_session* session = nullptr)
        = 0;

    // Replace the document with the same _id (or insert it if there isn't
    // one).
    virtual cppcoro::task<>
    save(
        string collection,
        dynamic_map document,
        store_session* session = nullptr)
        = 0;

    // Apply :update to the first document that matches :query.
    virtual cppcoro::task<update_result>
    update_one(
        string collection,
        document_query query,
        update_expression update,
        update_options options = update_options(),
        store_session* session = nullptr)
        = 0;

    // Apply :update to every document that matches :query.
    virtual cppcoro::task<update_result>
    update_many(
        string collection,
        document_query query,
        update_expression update,
        update_options options = update_options(),
        store_session* session = nullptr)
        = 0;

    // Delete every document that matches :query and return how many there
    // were.
    virtual cppcoro::task<integer>
    delete_many(
        string collection,
        document_query query,
        store_session* session = nullptr)
        = 0;

    virtual std::unique_ptr<store_session>
    begin_session() = 0;
};

// Get the _id of a document.
object_id
get_document_id(dynamic_map const& document);

} // namespace chronicle

#endif
