#ifndef CHRONICLE_PATCH_EXCLUSION_HPP
#define CHRONICLE_PATCH_EXCLUSION_HPP

#include <chronicle/patch/operation.hpp>

namespace chronicle {

// EXCLUSION - Exclude patterns keep selected parts of a document out of its
// change records.

// Parse a list of exclude pattern strings.
// Patterns that are empty after normalization (e.g., "" or "//") would
// exclude the whole document, so they're dropped.
std::vector<path_pattern>
parse_exclude_patterns(std::vector<string> const& patterns);

// Is the operation as a whole covered by one of :patterns?
bool
is_excluded(
    patch_operation const& op, std::vector<path_pattern> const& patterns);

// Remove the parts of :value that :pattern selects, starting from the
// pattern segment at :start. (The segments before :start are assumed to have
// been matched already.)
//
// Literal segments address map fields by key and array items by index. A
// wildcard applies the rest of the pattern to every item of an array. The
// selected parts of maps are removed, while selected array items are set to
// nil so that the positions of the other items don't change.
//
// If nothing is selected, the result is none.
optional<dynamic>
prune_value(dynamic const& value, path_pattern const& pattern, size_t start);

// Copy the parts of :source that :pattern selects (from the segment at
// :start onwards) over the corresponding parts of :target.
//
// Selected map fields that :source lacks are removed from :target. Selected
// parts whose parent doesn't exist in :target (or isn't the same kind of
// structure there) are left alone.
dynamic
carry_excluded_value(
    dynamic const& source,
    dynamic const& target,
    path_pattern const& pattern,
    size_t start);

// Apply carry_excluded_value at the root for every pattern in :patterns.
dynamic_map
carry_excluded_fields(
    dynamic_map const& source,
    dynamic_map const& target,
    std::vector<path_pattern> const& patterns);

// Filter a list of operations through a set of exclude patterns.
//
// Operations that are covered by a pattern are dropped. For patterns that
// reach into an operation's value, the selected parts of the value are
// pruned, and if that leaves the value as an empty map or array, the
// operation is dropped as well. Operations without values (remove, move,
// copy) are only subject to the first check.
//
// Filtering an already filtered list with the same patterns leaves it
// unchanged.
patch_operation_list
filter_operations(
    patch_operation_list const& ops, std::vector<path_pattern> const& patterns);

} // namespace chronicle

#endif
