#include <chronicle/patch/exclusion.hpp>

#include <algorithm>

namespace chronicle {

std::vector<path_pattern>
parse_exclude_patterns(std::vector<string> const& patterns)
{
    std::vector<path_pattern> parsed;
    for (auto const& pattern : patterns)
    {
        auto p = parse_path_pattern(pattern);
        if (!p.empty())
            parsed.push_back(std::move(p));
    }
    return parsed;
}

bool
is_excluded(
    patch_operation const& op, std::vector<path_pattern> const& patterns)
{
    return std::any_of(
        patterns.begin(), patterns.end(), [&](path_pattern const& pattern) {
            return pattern_contains(pattern, op.path);
        });
}

static optional<dynamic>
prune_map(
    dynamic_map const& map, path_pattern const& pattern, size_t start)
{
    auto const& segment = pattern[start];
    // Wildcards only select array items.
    if (segment.wildcard)
        return none;
    auto field = map.find(segment.literal);
    if (field == map.end())
        return none;
    if (start + 1 == pattern.size())
    {
        dynamic_map pruned = map;
        pruned.erase(segment.literal);
        return dynamic(std::move(pruned));
    }
    auto pruned_field = prune_value(field->second, pattern, start + 1);
    if (!pruned_field)
        return none;
    dynamic_map pruned = map;
    pruned[segment.literal] = std::move(*pruned_field);
    return dynamic(std::move(pruned));
}

static optional<dynamic>
prune_array(
    dynamic_array const& array, path_pattern const& pattern, size_t start)
{
    auto const& segment = pattern[start];
    bool is_last = start + 1 == pattern.size();
    if (segment.wildcard)
    {
        // A trailing wildcard would blank out every item, which isn't
        // something an exclude pattern can ask for.
        if (is_last)
            return none;
        dynamic_array pruned;
        pruned.reserve(array.size());
        bool changed = false;
        for (auto const& item : array)
        {
            auto pruned_item = prune_value(item, pattern, start + 1);
            if (pruned_item)
            {
                pruned.push_back(std::move(*pruned_item));
                changed = true;
            }
            else
            {
                pruned.push_back(item);
            }
        }
        if (!changed)
            return none;
        return dynamic(std::move(pruned));
    }
    if (!is_array_index(segment.literal))
        return none;
    auto index = to_array_index(segment.literal);
    if (index >= array.size())
        return none;
    if (is_last)
    {
        if (array[index].type() == value_type::NIL)
            return none;
        dynamic_array pruned = array;
        pruned[index] = nil;
        return dynamic(std::move(pruned));
    }
    auto pruned_item = prune_value(array[index], pattern, start + 1);
    if (!pruned_item)
        return none;
    dynamic_array pruned = array;
    pruned[index] = std::move(*pruned_item);
    return dynamic(std::move(pruned));
}

optional<dynamic>
prune_value(dynamic const& value, path_pattern const& pattern, size_t start)
{
    if (start >= pattern.size())
        return none;
    switch (value.type())
    {
        case value_type::MAP:
            return prune_map(cast<dynamic_map>(value), pattern, start);
        case value_type::ARRAY:
            return prune_array(cast<dynamic_array>(value), pattern, start);
        default:
            return none;
    }
}

static dynamic
carry_into_map(
    dynamic_map const& source,
    dynamic_map const& target,
    path_pattern const& pattern,
    size_t start)
{
    auto const& segment = pattern[start];
    if (segment.wildcard)
        return target;
    auto from = source.find(segment.literal);
    if (start + 1 == pattern.size())
    {
        dynamic_map carried = target;
        if (from != source.end())
            carried[segment.literal] = from->second;
        else
            carried.erase(segment.literal);
        return carried;
    }
    auto to = target.find(segment.literal);
    if (from == source.end() || to == target.end())
        return target;
    dynamic_map carried = target;
    carried[segment.literal] = carry_excluded_value(
        from->second, to->second, pattern, start + 1);
    return carried;
}

static dynamic
carry_into_array(
    dynamic_array const& source,
    dynamic_array const& target,
    path_pattern const& pattern,
    size_t start)
{
    auto const& segment = pattern[start];
    bool is_last = start + 1 == pattern.size();
    size_t common_size = std::min(source.size(), target.size());
    dynamic_array carried = target;
    auto carry_item = [&](size_t index) {
        if (is_last)
        {
            carried[index] = source[index];
        }
        else
        {
            carried[index] = carry_excluded_value(
                source[index], target[index], pattern, start + 1);
        }
    };
    if (segment.wildcard)
    {
        for (size_t i = 0; i != common_size; ++i)
            carry_item(i);
    }
    else if (is_array_index(segment.literal))
    {
        auto index = to_array_index(segment.literal);
        if (index < common_size)
            carry_item(index);
    }
    return carried;
}

dynamic
carry_excluded_value(
    dynamic const& source,
    dynamic const& target,
    path_pattern const& pattern,
    size_t start)
{
    if (start >= pattern.size())
        return source;
    if (source.type() == value_type::MAP && target.type() == value_type::MAP)
    {
        return carry_into_map(
            cast<dynamic_map>(source),
            cast<dynamic_map>(target),
            pattern,
            start);
    }
    if (source.type() == value_type::ARRAY
        && target.type() == value_type::ARRAY)
    {
        return carry_into_array(
            cast<dynamic_array>(source),
            cast<dynamic_array>(target),
            pattern,
            start);
    }
    return target;
}

dynamic_map
carry_excluded_fields(
    dynamic_map const& source,
    dynamic_map const& target,
    std::vector<path_pattern> const& patterns)
{
    dynamic carried = target;
    for (auto const& pattern : patterns)
        carried = carry_excluded_value(source, carried, pattern, 0);
    return cast<dynamic_map>(std::move(carried));
}

patch_operation_list
filter_operations(
    patch_operation_list const& ops, std::vector<path_pattern> const& patterns)
{
    patch_operation_list filtered;
    for (auto const& op : ops)
    {
        if (is_excluded(op, patterns))
            continue;
        if (!op.value)
        {
            filtered.push_back(op);
            continue;
        }
        dynamic value = *op.value;
        bool pruned = false;
        for (auto const& pattern : patterns)
        {
            if (!pattern_extends(pattern, op.path))
                continue;
            auto pruned_value = prune_value(value, pattern, op.path.size());
            if (pruned_value)
            {
                value = std::move(*pruned_value);
                pruned = true;
            }
        }
        if (pruned && is_empty_structure(value))
            continue;
        patch_operation kept = op;
        kept.value = std::move(value);
        filtered.push_back(std::move(kept));
    }
    return filtered;
}

} // namespace chronicle
