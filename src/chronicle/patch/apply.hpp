#ifndef CHRONICLE_PATCH_APPLY_HPP
#define CHRONICLE_PATCH_APPLY_HPP

#include <chronicle/patch/operation.hpp>

namespace chronicle {

// This is thrown when an operation can't be applied: a "test" doesn't hold,
// a path doesn't exist where it must, an array index is out of range, etc.
CHRONICLE_DEFINE_EXCEPTION(patch_apply_failure)
// the position of the failing operation within the list being applied
CHRONICLE_DEFINE_ERROR_INFO(size_t, operation_index)
// (The failing operation's path is provided as patch_path_info, and a
// description of the problem as internal_error_message_info.)

// Apply a single operation to :value and return the result.
dynamic
apply_operation(dynamic const& value, patch_operation const& op);

// Apply a list of operations (in order) to :value and return the result.
// If any operation fails, this throws patch_apply_failure and no result is
// produced.
dynamic
apply_patch(dynamic const& value, patch_operation_list const& ops);

} // namespace chronicle

#endif
