#ifndef CHRONICLE_PATCH_DIFF_HPP
#define CHRONICLE_PATCH_DIFF_HPP

#include <chronicle/patch/operation.hpp>

namespace chronicle {

// Compute the list of operations that transforms :prior into :current.
//
// Both values are normalized first, so values that differ only in their
// representation (e.g., an object_id vs. its hex string) are considered
// equal. Within maps, operations follow the field order of :current, with
// removals of fields that no longer exist coming last. Within arrays, common
// items are diffed individually, new trailing items are added in ascending
// order and old trailing items are removed in descending order.
// Moves and copies are never detected.
//
// Applying the resulting operations to :prior yields :current.
patch_operation_list
compute_patch(dynamic const& prior, dynamic const& current);

} // namespace chronicle

#endif
