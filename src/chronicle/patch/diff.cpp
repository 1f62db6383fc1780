#include <chronicle/patch/diff.hpp>

#include <algorithm>

#include <chronicle/core/normalization.hpp>

namespace chronicle {

static patch_path
extend_path(patch_path const& path, string const& addition)
{
    patch_path extended = path;
    extended.push_back(addition);
    return extended;
}

static patch_path
extend_path(patch_path const& path, size_t index)
{
    return extend_path(path, lexical_cast<string>(index));
}

static void
compute_value_diff(
    patch_operation_list& diff,
    patch_path const& path,
    dynamic const& a,
    dynamic const& b);

static void
compute_map_diff(
    patch_operation_list& diff,
    patch_path const& path,
    dynamic_map const& a,
    dynamic_map const& b)
{
    // Changed and new fields, in the order that they appear in b.
    for (auto const& field : b)
    {
        auto existing = a.find(field.first);
        if (existing != a.end())
        {
            compute_value_diff(
                diff,
                extend_path(path, field.first),
                existing->second,
                field.second);
        }
        else
        {
            diff.push_back(make_add_operation(
                extend_path(path, field.first), field.second));
        }
    }
    // Fields that only exist in a.
    for (auto const& field : a)
    {
        if (b.find(field.first) == b.end())
        {
            diff.push_back(
                make_remove_operation(extend_path(path, field.first)));
        }
    }
}

static void
compute_array_diff(
    patch_operation_list& diff,
    patch_path const& path,
    dynamic_array const& a,
    dynamic_array const& b)
{
    size_t a_size = a.size();
    size_t b_size = b.size();
    size_t common_size = std::min(a_size, b_size);

    for (size_t i = 0; i != common_size; ++i)
        compute_value_diff(diff, extend_path(path, i), a[i], b[i]);

    // Items were appended.
    for (size_t i = common_size; i < b_size; ++i)
        diff.push_back(make_add_operation(extend_path(path, i), b[i]));

    // Items were dropped from the end. They're removed from the back so that
    // the indices of the remaining ones stay valid.
    for (size_t i = a_size; i > common_size; --i)
        diff.push_back(make_remove_operation(extend_path(path, i - 1)));
}

static void
compute_value_diff(
    patch_operation_list& diff,
    patch_path const& path,
    dynamic const& a,
    dynamic const& b)
{
    if (!normalized_equal(a, b))
    {
        // If a and b are both maps, do a field-by-field diff.
        if (a.type() == value_type::MAP && b.type() == value_type::MAP)
        {
            compute_map_diff(
                diff, path, cast<dynamic_map>(a), cast<dynamic_map>(b));
        }
        // If a and b are both arrays, do an item-by-item diff.
        else if (
            a.type() == value_type::ARRAY && b.type() == value_type::ARRAY)
        {
            compute_array_diff(
                diff, path, cast<dynamic_array>(a), cast<dynamic_array>(b));
        }
        // Otherwise, there's no way to break down the change, so just
        // replace the whole value.
        else
        {
            diff.push_back(make_replace_operation(path, b));
        }
    }
}

patch_operation_list
compute_patch(dynamic const& prior, dynamic const& current)
{
    patch_operation_list diff;
    compute_value_diff(
        diff, patch_path(), normalize_value(prior), normalize_value(current));
    return diff;
}

} // namespace chronicle
