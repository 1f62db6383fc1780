#include <chronicle/core/dynamic.hpp>

#include <algorithm>
#include <ostream>

#include <chronicle/encodings/yaml.hpp>

namespace chronicle {

std::ostream&
operator<<(std::ostream& s, value_type t)
{
    switch (t)
    {
        case value_type::NIL:
            s << "nil";
            break;
        case value_type::BOOLEAN:
            s << "boolean";
            break;
        case value_type::INTEGER:
            s << "integer";
            break;
        case value_type::FLOAT:
            s << "float";
            break;
        case value_type::STRING:
            s << "string";
            break;
        case value_type::DATETIME:
            s << "datetime";
            break;
        case value_type::OBJECT_ID:
            s << "object_id";
            break;
        case value_type::ARRAY:
            s << "array";
            break;
        case value_type::MAP:
            s << "map";
            break;
        default:
            CHRONICLE_THROW(
                invalid_enum_value()
                << enum_id_info("value_type") << enum_value_info(int(t)));
    }
    return s;
}

void
check_type(value_type expected, value_type actual)
{
    if (expected != actual)
    {
        CHRONICLE_THROW(
            type_mismatch() << expected_value_type_info(expected)
                            << actual_value_type_info(actual));
    }
}

dynamic::dynamic(dynamic_map const& v)
{
    set(v);
}

dynamic::dynamic(dynamic_map&& v)
{
    set(std::move(v));
}

dynamic::dynamic(std::initializer_list<dynamic> list)
{
    // If this is a list of arrays, all of which are length two and have
    // strings as their first elements, treat it as a map.
    if (list.size() != 0
        && std::all_of(list.begin(), list.end(), [](dynamic const& v) {
               return v.type() == value_type::ARRAY
                      && cast<dynamic_array>(v).size() == 2
                      && cast<dynamic_array>(v)[0].type()
                             == value_type::STRING;
           }))
    {
        dynamic_map map;
        for (auto const& v : list)
        {
            auto const& array = cast<dynamic_array>(v);
            map[cast<string>(array[0])] = array[1];
        }
        *this = std::move(map);
    }
    else
    {
        *this = dynamic_array(list);
    }
}

void
dynamic::set(nil_t _)
{
    type_ = value_type::NIL;
    value_.reset();
}
void
dynamic::set(bool v)
{
    type_ = value_type::BOOLEAN;
    value_ = v;
}
void
dynamic::set(integer v)
{
    type_ = value_type::INTEGER;
    value_ = v;
}
void
dynamic::set(double v)
{
    type_ = value_type::FLOAT;
    value_ = v;
}
void
dynamic::set(string const& v)
{
    type_ = value_type::STRING;
    value_ = v;
}
void
dynamic::set(string&& v)
{
    type_ = value_type::STRING;
    value_ = std::move(v);
}
void
dynamic::set(ptime const& v)
{
    type_ = value_type::DATETIME;
    value_ = v;
}
void
dynamic::set(object_id const& v)
{
    type_ = value_type::OBJECT_ID;
    value_ = v;
}
void
dynamic::set(dynamic_array const& v)
{
    type_ = value_type::ARRAY;
    value_ = v;
}
void
dynamic::set(dynamic_array&& v)
{
    type_ = value_type::ARRAY;
    value_ = std::move(v);
}
void
dynamic::set(dynamic_map const& v)
{
    type_ = value_type::MAP;
    value_ = v;
}
void
dynamic::set(dynamic_map&& v)
{
    type_ = value_type::MAP;
    value_ = std::move(v);
}

void
swap(dynamic& a, dynamic& b)
{
    using std::swap;
    swap(a.type_, b.type_);
    swap(a.value_, b.value_);
}

// DYNAMIC MAPS

dynamic_map::dynamic_map(std::initializer_list<value_type> fields)
{
    for (auto const& field : fields)
        (*this)[field.first] = field.second;
}

dynamic_map::iterator
dynamic_map::find(string const& key)
{
    return std::find_if(fields_.begin(), fields_.end(), [&](auto const& f) {
        return f.first == key;
    });
}

dynamic_map::const_iterator
dynamic_map::find(string const& key) const
{
    return std::find_if(fields_.begin(), fields_.end(), [&](auto const& f) {
        return f.first == key;
    });
}

dynamic&
dynamic_map::operator[](string const& key)
{
    auto i = find(key);
    if (i != fields_.end())
        return i->second;
    fields_.emplace_back(key, dynamic());
    return fields_.back().second;
}

std::pair<dynamic_map::iterator, bool>
dynamic_map::insert(value_type field)
{
    auto i = find(field.first);
    if (i != fields_.end())
        return std::make_pair(i, false);
    fields_.push_back(std::move(field));
    return std::make_pair(std::prev(fields_.end()), true);
}

size_t
dynamic_map::erase(string const& key)
{
    auto i = find(key);
    if (i == fields_.end())
        return 0;
    fields_.erase(i);
    return 1;
}

dynamic_map::iterator
dynamic_map::erase(const_iterator position)
{
    return fields_.erase(position);
}

bool
operator==(dynamic_map const& a, dynamic_map const& b)
{
    if (a.size() != b.size())
        return false;
    for (auto const& field : a)
    {
        auto other = b.find(field.first);
        if (other == b.end() || other->second != field.second)
            return false;
    }
    return true;
}
bool
operator!=(dynamic_map const& a, dynamic_map const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v)
{
    os << value_to_diagnostic_yaml(v);
    return os;
}

std::ostream&
operator<<(std::ostream& os, dynamic_map const& v)
{
    os << dynamic(v);
    return os;
}

std::ostream&
operator<<(std::ostream& os, std::list<dynamic> const& v)
{
    os << dynamic(std::vector<dynamic>{std::begin(v), std::end(v)});
    return os;
}

// COMPARISON OPERATORS

bool
operator==(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return false;
    return apply_to_dynamic_pair(
        [](auto const& x, auto const& y) { return x == y; }, a, b);
}
bool
operator!=(dynamic const& a, dynamic const& b)
{
    return !(a == b);
}

dynamic const&
get_field(dynamic_map const& r, string const& field)
{
    dynamic const* v;
    if (!get_field(&v, r, field))
    {
        CHRONICLE_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

dynamic&
get_field(dynamic_map& r, string const& field)
{
    dynamic* v;
    if (!get_field(&v, r, field))
    {
        CHRONICLE_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

bool
get_field(dynamic const** v, dynamic_map const& r, string const& field)
{
    auto i = r.find(field);
    if (i == r.end())
        return false;
    *v = &i->second;
    return true;
}

bool
get_field(dynamic** v, dynamic_map& r, string const& field)
{
    auto i = r.find(field);
    if (i == r.end())
        return false;
    *v = &i->second;
    return true;
}

void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element)
{
    std::list<dynamic>* info = get_error_info<dynamic_value_path_info>(e);
    if (info)
    {
        info->push_front(path_element);
    }
    else
    {
        e << dynamic_value_path_info(std::list<dynamic>({path_element}));
    }
}

bool
is_empty_structure(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::MAP:
            return cast<dynamic_map>(v).empty();
        case value_type::ARRAY:
            return cast<dynamic_array>(v).empty();
        default:
            return false;
    }
}

} // namespace chronicle
