#ifndef CHRONICLE_HISTORY_CAPTURE_HPP
#define CHRONICLE_HISTORY_CAPTURE_HPP

#include <variant>

#include <chronicle/store/document_store.hpp>

namespace chronicle {

// CHANGE CAPTURE - When a mutation is expressed as a query plus an update,
// the tracker never holds the affected documents itself. Instead, it
// captures their data before the mutation is sent to the store and then
// re-finds them afterwards. The structures here hold the state that crosses
// that boundary, and the functions decide how the affected documents are
// found again.

// the state of one document before a mutation
struct captured_document
{
    object_id id;
    dynamic_map snapshot;
};

bool
operator==(captured_document const& a, captured_document const& b);
bool
operator!=(captured_document const& a, captured_document const& b);

std::ostream&
operator<<(std::ostream& s, captured_document const& c);

// capture context for an update of (at most) one document
struct single_capture_context
{
    document_query query;
    update_expression update;
    // the document that matched before the update, if any
    optional<captured_document> prior;
};

// capture context for an update of any number of documents
struct batch_capture_context
{
    document_query query;
    update_expression update;
    // everything that matched before the update, in match order
    std::vector<captured_document> priors;
};

// RESOLUTION STRATEGIES - After the update, the affected documents are found
// either by the identities that were captured before the update or (when
// nothing was captured, because the update created the document) by the
// original query merged with the update's direct assignments.

struct by_identity_set
{
    std::vector<object_id> ids;
};

struct by_merged_conditions
{
    document_query conditions;
};

typedef std::variant<by_identity_set, by_merged_conditions>
    resolution_strategy;

resolution_strategy
choose_resolution_strategy(single_capture_context const& context);

resolution_strategy
choose_resolution_strategy(batch_capture_context const& context);

// Get the query that implements a resolution strategy.
document_query
to_query(resolution_strategy const& strategy);

// Did an update leave the store untouched (nothing matched and nothing was
// inserted)? Stores that don't report counts are never considered untouched.
bool
update_touched_nothing(update_result const& result);

// a document as resolved after an update, paired with its prior snapshot
struct capture_pairing
{
    object_id id;
    // the snapshot before the update (empty for new documents)
    dynamic_map prior;
    // the document itself, as stored after the update
    dynamic_map document;
};

// Pair each resolved document with the prior snapshot that has the same ID.
// Resolved documents with no prior get an empty one. Priors with no
// resolved document are dropped.
std::vector<capture_pairing>
pair_by_identity(
    std::vector<captured_document> const& priors,
    std::vector<dynamic_map> const& resolved);

} // namespace chronicle

#endif
