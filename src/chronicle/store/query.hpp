#ifndef CHRONICLE_STORE_QUERY_HPP
#define CHRONICLE_STORE_QUERY_HPP

#include <chronicle/store/document_store.hpp>

namespace chronicle {

// QUERIES AND UPDATES - These implement the query and update languages
// described in document_store.hpp for stores that keep documents as dynamic
// values.

// This is thrown when a query or update uses an unsupported operator or
// applies one to the wrong kind of value.
CHRONICLE_DEFINE_EXCEPTION(invalid_query)
CHRONICLE_DEFINE_EXCEPTION(invalid_update)
CHRONICLE_DEFINE_ERROR_INFO(string, query_operator)

// Does :document match :query?
// Values are compared in their normalized forms. If the document's value is
// an array, the condition also holds if any of its items is equal to the
// queried value.
bool
matches_query(dynamic_map const& document, document_query const& query);

// Apply :update to :document and return the result.
// :inserting should be true when the document is being created by an upsert
// (in which case $setOnInsert assignments also apply).
dynamic_map
apply_update(
    dynamic_map const& document,
    update_expression const& update,
    bool inserting = false);

// Build the document that an upsert inserts when nothing matches :query.
// It consists of the query's equality conditions with the update applied.
// If that doesn't produce an _id, a new one is generated.
dynamic_map
make_upsert_document(
    document_query const& query, update_expression const& update);

// Merge a query's conditions with the direct assignments of an update.
// The update's $set fields are used if it has them (otherwise, the update
// itself), overlaid on :conditions. Any fields whose names contain a '$'
// are dropped from the result.
document_query
merge_conditions_with_update(
    document_query const& conditions, update_expression const& update);

// Make a query that matches a single document by ID.
document_query
make_id_query(object_id const& id);

// Make a query that matches any of the given documents.
document_query
make_id_query(std::vector<object_id> const& ids);

// Get the value at a dotted path within a document (or null if there's
// nothing there).
dynamic const*
find_dotted_field(dynamic_map const& document, string const& path);

} // namespace chronicle

#endif
