#include <chronicle/patch/apply.hpp>

#include <algorithm>

#include <chronicle/core/normalization.hpp>

namespace chronicle {

[[noreturn]] static void
throw_apply_failure(string const& message)
{
    CHRONICLE_THROW(
        patch_apply_failure() << internal_error_message_info(message));
}

static size_t
get_existing_index(dynamic_array const& array, string const& segment)
{
    if (!is_array_index(segment))
        throw_apply_failure("invalid array index: " + segment);
    auto index = to_array_index(segment);
    if (index >= array.size())
        throw_apply_failure("array index out of range: " + segment);
    return index;
}

enum class edit_kind
{
    ADD,
    REMOVE,
    REPLACE
};

// Edit the value at path[path_index...] within :initial, returning the edited
// copy.
static dynamic
edit_value(
    dynamic const& initial,
    patch_path const& path,
    size_t path_index,
    edit_kind kind,
    dynamic const& new_value)
{
    size_t path_size = path.size();

    // If we've reached the end of the path, we're acting on the whole value.
    if (path_index == path_size)
    {
        if (kind == edit_kind::REMOVE)
            throw_apply_failure("the root can't be removed");
        return new_value;
    }

    auto const& segment = path[path_index];
    bool is_last = path_index + 1 == path_size;
    switch (initial.type())
    {
        case value_type::MAP: {
            dynamic_map map = cast<dynamic_map>(initial);
            auto field = map.find(segment);
            if (is_last)
            {
                switch (kind)
                {
                    case edit_kind::ADD:
                        if (field != map.end())
                            field->second = new_value;
                        else
                            map[segment] = new_value;
                        break;
                    case edit_kind::REPLACE:
                        if (field == map.end())
                            throw_apply_failure("no such field: " + segment);
                        field->second = new_value;
                        break;
                    case edit_kind::REMOVE:
                        if (field == map.end())
                            throw_apply_failure("no such field: " + segment);
                        map.erase(field);
                        break;
                }
            }
            else
            {
                if (field == map.end())
                    throw_apply_failure("no such field: " + segment);
                field->second = edit_value(
                    field->second, path, path_index + 1, kind, new_value);
            }
            return map;
        }
        case value_type::ARRAY: {
            dynamic_array array = cast<dynamic_array>(initial);
            if (is_last)
            {
                switch (kind)
                {
                    case edit_kind::ADD:
                        if (segment == "-")
                        {
                            array.push_back(new_value);
                        }
                        else
                        {
                            if (!is_array_index(segment)
                                || to_array_index(segment) > array.size())
                            {
                                throw_apply_failure(
                                    "invalid insertion index: " + segment);
                            }
                            array.insert(
                                array.begin() + to_array_index(segment),
                                new_value);
                        }
                        break;
                    case edit_kind::REPLACE:
                        array[get_existing_index(array, segment)] = new_value;
                        break;
                    case edit_kind::REMOVE:
                        array.erase(
                            array.begin() + get_existing_index(array, segment));
                        break;
                }
            }
            else
            {
                auto index = get_existing_index(array, segment);
                array[index] = edit_value(
                    array[index], path, path_index + 1, kind, new_value);
            }
            return array;
        }
        default:
            throw_apply_failure(
                "can't descend into a " + lexical_cast<string>(initial.type())
                + " value");
    }
}

static dynamic const&
get_existing_value(dynamic const& value, patch_path const& path)
{
    auto found = find_value_at_path(value, path);
    if (!found)
        throw_apply_failure("no value at " + format_path(path));
    return *found;
}

// Is :a a proper prefix of :b?
static bool
is_proper_prefix(patch_path const& a, patch_path const& b)
{
    return a.size() < b.size() && std::equal(a.begin(), a.end(), b.begin());
}

dynamic
apply_operation(dynamic const& value, patch_operation const& op)
{
    if (bool(op.value) != op_has_value(op.op)
        || bool(op.from) != op_has_from(op.op))
    {
        throw_apply_failure(
            string("malformed ") + get_patch_op_name(op.op) + " operation");
    }
    switch (op.op)
    {
        case patch_op::ADD:
        default:
            return edit_value(value, op.path, 0, edit_kind::ADD, *op.value);
        case patch_op::REMOVE:
            return edit_value(value, op.path, 0, edit_kind::REMOVE, nil);
        case patch_op::REPLACE:
            return edit_value(
                value, op.path, 0, edit_kind::REPLACE, *op.value);
        case patch_op::MOVE: {
            if (*op.from == op.path)
                return value;
            if (is_proper_prefix(*op.from, op.path))
                throw_apply_failure("a value can't be moved into itself");
            dynamic moved = get_existing_value(value, *op.from);
            auto removed
                = edit_value(value, *op.from, 0, edit_kind::REMOVE, nil);
            return edit_value(removed, op.path, 0, edit_kind::ADD, moved);
        }
        case patch_op::COPY: {
            dynamic copied = get_existing_value(value, *op.from);
            return edit_value(value, op.path, 0, edit_kind::ADD, copied);
        }
        case patch_op::TEST:
            if (!equivalent(get_existing_value(value, op.path), *op.value))
                throw_apply_failure("test failed");
            return value;
    }
}

dynamic
apply_patch(dynamic const& value, patch_operation_list const& ops)
{
    dynamic patched = value;
    for (size_t i = 0; i != ops.size(); ++i)
    {
        try
        {
            patched = apply_operation(patched, ops[i]);
        }
        catch (patch_apply_failure& e)
        {
            e << operation_index_info(i)
              << patch_path_info(format_path(ops[i].path));
            throw;
        }
    }
    return patched;
}

} // namespace chronicle
