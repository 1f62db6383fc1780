#include <chronicle/patch/operation.hpp>

#include <ostream>

#include <chronicle/core/normalization.hpp>

namespace chronicle {

char const*
get_patch_op_name(patch_op op)
{
    switch (op)
    {
        case patch_op::ADD:
            return "add";
        case patch_op::REMOVE:
            return "remove";
        case patch_op::REPLACE:
            return "replace";
        case patch_op::MOVE:
            return "move";
        case patch_op::COPY:
            return "copy";
        case patch_op::TEST:
            return "test";
    }
    CHRONICLE_THROW(
        invalid_enum_value() << enum_id_info("patch_op")
                             << enum_value_info(static_cast<int>(op)));
}

patch_op
parse_patch_op(string const& name)
{
    static patch_op const all_ops[]
        = {patch_op::ADD,
           patch_op::REMOVE,
           patch_op::REPLACE,
           patch_op::MOVE,
           patch_op::COPY,
           patch_op::TEST};
    for (auto op : all_ops)
    {
        if (name == get_patch_op_name(op))
            return op;
    }
    CHRONICLE_THROW(
        invalid_enum_string() << enum_id_info("patch_op")
                              << enum_string_info(name));
}

std::ostream&
operator<<(std::ostream& s, patch_op op)
{
    s << get_patch_op_name(op);
    return s;
}

void
to_dynamic(dynamic* v, patch_op x)
{
    *v = string(get_patch_op_name(x));
}

void
from_dynamic(patch_op* x, dynamic const& v)
{
    *x = parse_patch_op(cast<string>(v));
}

bool
op_has_value(patch_op op)
{
    return op == patch_op::ADD || op == patch_op::REPLACE
           || op == patch_op::TEST;
}

bool
op_has_from(patch_op op)
{
    return op == patch_op::MOVE || op == patch_op::COPY;
}

static bool
optional_values_equal(optional<dynamic> const& a, optional<dynamic> const& b)
{
    if (bool(a) != bool(b))
        return false;
    return !a || equivalent(*a, *b);
}

bool
operator==(patch_operation const& a, patch_operation const& b)
{
    return a.op == b.op && a.path == b.path
           && optional_values_equal(a.value, b.value) && a.from == b.from
           && optional_values_equal(a.original_value, b.original_value);
}
bool
operator!=(patch_operation const& a, patch_operation const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, patch_operation const& op)
{
    s << to_dynamic(op);
    return s;
}

static patch_operation
make_value_operation(patch_op op, patch_path path, dynamic value)
{
    patch_operation operation;
    operation.op = op;
    operation.path = std::move(path);
    operation.value = std::move(value);
    return operation;
}

static patch_operation
make_from_operation(patch_op op, patch_path from, patch_path path)
{
    patch_operation operation;
    operation.op = op;
    operation.path = std::move(path);
    operation.from = std::move(from);
    return operation;
}

patch_operation
make_add_operation(patch_path path, dynamic value)
{
    return make_value_operation(
        patch_op::ADD, std::move(path), std::move(value));
}

patch_operation
make_remove_operation(patch_path path)
{
    patch_operation operation;
    operation.op = patch_op::REMOVE;
    operation.path = std::move(path);
    return operation;
}

patch_operation
make_replace_operation(patch_path path, dynamic value)
{
    return make_value_operation(
        patch_op::REPLACE, std::move(path), std::move(value));
}

patch_operation
make_move_operation(patch_path from, patch_path path)
{
    return make_from_operation(
        patch_op::MOVE, std::move(from), std::move(path));
}

patch_operation
make_copy_operation(patch_path from, patch_path path)
{
    return make_from_operation(
        patch_op::COPY, std::move(from), std::move(path));
}

patch_operation
make_test_operation(patch_path path, dynamic value)
{
    return make_value_operation(
        patch_op::TEST, std::move(path), std::move(value));
}

void
check_operation(patch_operation const& op)
{
    if (bool(op.value) != op_has_value(op.op)
        || bool(op.from) != op_has_from(op.op))
    {
        CHRONICLE_THROW(
            invalid_patch_operation()
            << patch_op_name_info(get_patch_op_name(op.op))
            << patch_path_info(format_path(op.path)));
    }
}

void
to_dynamic(dynamic* v, patch_operation const& x)
{
    dynamic_map map;
    map["op"] = string(get_patch_op_name(x.op));
    map["path"] = format_path(x.path);
    if (x.value)
        map["value"] = *x.value;
    if (x.from)
        map["from"] = format_path(*x.from);
    if (x.original_value)
        map["originalValue"] = *x.original_value;
    *v = std::move(map);
}

void
from_dynamic(patch_operation* x, dynamic const& v)
{
    auto const& map = cast<dynamic_map>(v);
    patch_operation op;
    read_field_from_record(&op.op, map, "op");
    op.path = parse_path(from_dynamic<string>(get_field(map, "path")));
    dynamic const* field;
    if (get_field(&field, map, "value"))
        op.value = *field;
    if (get_field(&field, map, "from"))
        op.from = parse_path(from_dynamic<string>(*field));
    if (get_field(&field, map, "originalValue"))
        op.original_value = *field;
    check_operation(op);
    *x = std::move(op);
}

} // namespace chronicle
