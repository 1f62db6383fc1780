#include <chronicle/core/normalization.hpp>

#include <algorithm>

#include <chronicle/core/type_interfaces.hpp>

namespace chronicle {

dynamic
normalize_value(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::DATETIME:
            return to_value_string(cast<ptime>(v));
        case value_type::OBJECT_ID:
            return to_string(cast<object_id>(v));
        case value_type::ARRAY: {
            auto const& array = cast<dynamic_array>(v);
            dynamic_array normalized;
            normalized.reserve(array.size());
            for (auto const& item : array)
                normalized.push_back(normalize_value(item));
            return normalized;
        }
        case value_type::MAP:
            return normalize_map(cast<dynamic_map>(v));
        default:
            return v;
    }
}

dynamic_map
normalize_map(dynamic_map const& map)
{
    dynamic_map normalized;
    for (auto const& field : map)
        normalized[field.first] = normalize_value(field.second);
    return normalized;
}

bool
is_normalized(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::DATETIME:
        case value_type::OBJECT_ID:
            return false;
        case value_type::ARRAY: {
            auto const& array = cast<dynamic_array>(v);
            return std::all_of(
                array.begin(), array.end(), CHRONICLE_LAMBDIFY(is_normalized));
        }
        case value_type::MAP: {
            auto const& map = cast<dynamic_map>(v);
            return std::all_of(map.begin(), map.end(), [](auto const& field) {
                return is_normalized(field.second);
            });
        }
        default:
            return true;
    }
}

static bool
is_number(dynamic const& v)
{
    return v.type() == value_type::INTEGER || v.type() == value_type::FLOAT;
}

static double
to_double(dynamic const& v)
{
    return v.type() == value_type::INTEGER ? double(cast<integer>(v))
                                           : cast<double>(v);
}

bool
normalized_equal(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
    {
        return is_number(a) && is_number(b) && to_double(a) == to_double(b);
    }
    switch (a.type())
    {
        case value_type::ARRAY: {
            auto const& x = cast<dynamic_array>(a);
            auto const& y = cast<dynamic_array>(b);
            return std::equal(
                x.begin(),
                x.end(),
                y.begin(),
                y.end(),
                CHRONICLE_LAMBDIFY(normalized_equal));
        }
        case value_type::MAP: {
            auto const& x = cast<dynamic_map>(a);
            auto const& y = cast<dynamic_map>(b);
            if (x.size() != y.size())
                return false;
            return std::all_of(x.begin(), x.end(), [&](auto const& field) {
                auto other = y.find(field.first);
                return other != y.end()
                       && normalized_equal(field.second, other->second);
            });
        }
        default:
            return a == b;
    }
}

bool
equivalent(dynamic const& a, dynamic const& b)
{
    if (is_normalized(a) && is_normalized(b))
        return normalized_equal(a, b);
    return normalized_equal(normalize_value(a), normalize_value(b));
}

} // namespace chronicle
