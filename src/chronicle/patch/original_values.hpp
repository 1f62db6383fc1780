#ifndef CHRONICLE_PATCH_ORIGINAL_VALUES_HPP
#define CHRONICLE_PATCH_ORIGINAL_VALUES_HPP

#include <chronicle/patch/operation.hpp>

namespace chronicle {

// Annotate each operation with the value that was at its path in :prior.
// Operations whose path doesn't exist in :prior get no original value.
// (For a document that didn't exist before, :prior should be an empty map.)
patch_operation_list
annotate_original_values(
    patch_operation_list const& ops, dynamic const& prior);

} // namespace chronicle

#endif
