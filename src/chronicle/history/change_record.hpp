#ifndef CHRONICLE_HISTORY_CHANGE_RECORD_HPP
#define CHRONICLE_HISTORY_CHANGE_RECORD_HPP

#include <chronicle/patch/operation.hpp>
#include <chronicle/patch/path.hpp>

namespace chronicle {

// CHANGE RECORDS - A change record describes one transition of one document
// as a list of patch operations. A document's history is the list of all its
// change records, ordered by (date, id).
//
// Records are stored as documents of their own with the fields "_id",
// "date", "ref" and "ops". Any extra fields (see history_options::includes)
// are stored alongside those.

struct change_record
{
    object_id id;

    ptime date;

    // the ID of the document that changed
    object_id ref;

    patch_operation_list ops;

    dynamic_map extra;
};

bool
operator==(change_record const& a, change_record const& b);
bool
operator!=(change_record const& a, change_record const& b);

std::ostream&
operator<<(std::ostream& s, change_record const& record);

void
to_dynamic(dynamic* v, change_record const& x);

void
from_dynamic(change_record* x, dynamic const& v);

// Does :a come before :b in a history?
bool
record_precedes(change_record const& a, change_record const& b);

// Sort a list of records into history order.
void
sort_history(std::vector<change_record>& history);

// Compute the operations that describe the change from :prior to :current
// after exclusion. If :annotate_original is set, each operation also carries
// the value it replaced. If nothing survives, the result is none.
optional<patch_operation_list>
compute_change_ops(
    dynamic const& prior,
    dynamic const& current,
    std::vector<path_pattern> const& excludes,
    bool annotate_original);

// Same, but this wraps the operations in a new change record for the
// document :ref, dated :date.
optional<change_record>
compute_change_record(
    object_id const& ref,
    dynamic const& prior,
    dynamic const& current,
    std::vector<path_pattern> const& excludes,
    bool annotate_original,
    ptime const& date);

} // namespace chronicle

#endif
