#ifndef CHRONICLE_PATCH_OPERATION_HPP
#define CHRONICLE_PATCH_OPERATION_HPP

#include <iosfwd>
#include <vector>

#include <chronicle/core/type_interfaces.hpp>
#include <chronicle/patch/path.hpp>

namespace chronicle {

// PATCH OPERATIONS - These are the JSON Patch (RFC 6902) operations that make
// up a change record.

enum class patch_op
{
    ADD,
    REMOVE,
    REPLACE,
    MOVE,
    COPY,
    TEST
};

// Get the wire name of an operation ("add", "remove", etc.).
char const*
get_patch_op_name(patch_op op);

// Get the operation with the given wire name.
// Throws invalid_enum_string if there isn't one.
patch_op
parse_patch_op(string const& name);

std::ostream&
operator<<(std::ostream& s, patch_op op);

void
to_dynamic(dynamic* v, patch_op x);
void
from_dynamic(patch_op* x, dynamic const& v);

// Does an operation of this kind carry a value?
bool
op_has_value(patch_op op);

// Does an operation of this kind carry a source path?
bool
op_has_from(patch_op op);

struct patch_operation
{
    patch_op op = patch_op::ADD;

    patch_path path;

    // present iff :op is ADD, REPLACE or TEST
    optional<dynamic> value;

    // present iff :op is MOVE or COPY
    optional<patch_path> from;

    // The value found at :path before the change was made (if it was
    // requested and there was one).
    optional<dynamic> original_value;
};

bool
operator==(patch_operation const& a, patch_operation const& b);
bool
operator!=(patch_operation const& a, patch_operation const& b);

std::ostream&
operator<<(std::ostream& s, patch_operation const& op);

patch_operation
make_add_operation(patch_path path, dynamic value);

patch_operation
make_remove_operation(patch_path path);

patch_operation
make_replace_operation(patch_path path, dynamic value);

patch_operation
make_move_operation(patch_path from, patch_path path);

patch_operation
make_copy_operation(patch_path from, patch_path path);

patch_operation
make_test_operation(patch_path path, dynamic value);

// This is thrown when an operation violates the value/from invariants above
// (e.g., a "remove" carrying a value or a "move" without a source).
CHRONICLE_DEFINE_EXCEPTION(invalid_patch_operation)
CHRONICLE_DEFINE_ERROR_INFO(string, patch_op_name)
CHRONICLE_DEFINE_ERROR_INFO(string, patch_path)

// Check that :op respects the invariants above.
void
check_operation(patch_operation const& op);

// Operations are encoded as maps of the form
// { "op": "replace", "path": "/a/b", "value": ..., "originalValue": ... }.
void
to_dynamic(dynamic* v, patch_operation const& x);
void
from_dynamic(patch_operation* x, dynamic const& v);

typedef std::vector<patch_operation> patch_operation_list;

} // namespace chronicle

#endif
