#ifndef CHRONICLE_CORE_DYNAMIC_HPP
#define CHRONICLE_CORE_DYNAMIC_HPP

#include <iosfwd>
#include <list>

#include <chronicle/core/exception.hpp>
#include <chronicle/core/type_definitions.hpp>

namespace chronicle {

// DYNAMIC VALUES - Dynamic values are values whose structure is determined at
// run-time rather than compile time.

std::ostream&
operator<<(std::ostream& s, value_type t);

// Check that two value types match.
void
check_type(value_type expected, value_type actual);

// If the above check fails, it throws this exception.
CHRONICLE_DEFINE_EXCEPTION(type_mismatch)
CHRONICLE_DEFINE_ERROR_INFO(value_type, expected_value_type)
CHRONICLE_DEFINE_ERROR_INFO(value_type, actual_value_type)

// Get the value_type value for a C++ type.
template<class T>
struct value_type_of
{
};
template<>
struct value_type_of<nil_t>
{
    static value_type const value = value_type::NIL;
};
template<>
struct value_type_of<bool>
{
    static value_type const value = value_type::BOOLEAN;
};
template<>
struct value_type_of<integer>
{
    static value_type const value = value_type::INTEGER;
};
template<>
struct value_type_of<double>
{
    static value_type const value = value_type::FLOAT;
};
template<>
struct value_type_of<string>
{
    static value_type const value = value_type::STRING;
};
template<>
struct value_type_of<ptime>
{
    static value_type const value = value_type::DATETIME;
};
template<>
struct value_type_of<object_id>
{
    static value_type const value = value_type::OBJECT_ID;
};
template<>
struct value_type_of<dynamic_array>
{
    static value_type const value = value_type::ARRAY;
};
template<>
struct value_type_of<dynamic_map>
{
    static value_type const value = value_type::MAP;
};

// MAPS

// This queries a map for a field with a key matching the given string.
// If the field is not present in the map, an exception is thrown.
dynamic const&
get_field(dynamic_map const& r, string const& field);
// non-const version
dynamic&
get_field(dynamic_map& r, string const& field);

CHRONICLE_DEFINE_EXCEPTION(missing_field)
CHRONICLE_DEFINE_ERROR_INFO(string, field_name)

// This is the same as above, but its return value indicates whether or not
// the field is in the map.
bool
get_field(dynamic const** v, dynamic_map const& r, string const& field);
// non-const version
bool
get_field(dynamic** v, dynamic_map& r, string const& field);

// When an error occurs in the processing of a dynamic value, this provides the
// path to the location within the value where the error occurred.
CHRONICLE_DEFINE_ERROR_INFO(std::list<dynamic>, dynamic_value_path)

// Given an exception :e, this will add :path_element to the beginning of the
// dynamic_value_path info associated with :e. If there is currently no path
// info associated with :e, a path containing only :p is associated with it.
void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element);

// Is :v an empty map or an empty array?
bool
is_empty_structure(dynamic const& v);

// VALUES

// Cast a dynamic value to one of the base types.
template<class T>
T const&
cast(dynamic const& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T const&>(v.contents());
}
// Same, but with a non-const reference.
template<class T>
T&
cast(dynamic& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&>(v.contents());
}
// Same, but with move semantics.
template<class T>
T&&
cast(dynamic&& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&&>(std::move(v).contents());
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v);

std::ostream&
operator<<(std::ostream& os, dynamic_map const& v);

std::ostream&
operator<<(std::ostream& os, std::list<dynamic> const& v);

void
swap(dynamic& a, dynamic& b);

bool
operator==(dynamic const& a, dynamic const& b);
bool
operator!=(dynamic const& a, dynamic const& b);

// Map comparison ignores field order.
bool
operator==(dynamic_map const& a, dynamic_map const& b);
bool
operator!=(dynamic_map const& a, dynamic_map const& b);

inline bool
operator==(nil_t, nil_t)
{
    return true;
}

inline void
to_dynamic(dynamic* v, dynamic const& x)
{
    *v = x;
}
inline void
from_dynamic(dynamic* x, dynamic const& v)
{
    *x = v;
}

// All regular Chronicle types provide to_dynamic(&v, x) and
// from_dynamic(&x, v). The following are alternate, often more convenient
// forms.
template<class T>
dynamic
to_dynamic(T const& x)
{
    dynamic v;
    to_dynamic(&v, x);
    return v;
}
template<class T>
T
from_dynamic(dynamic const& v)
{
    T x;
    from_dynamic(&x, v);
    return x;
}

// Apply the functor fn to the value v.
// fn must have the function call operator overloaded for all supported
// types (including nil). If it doesn't, you'll get a compile-time error.
template<class Fn>
auto
apply_to_dynamic(Fn&& fn, dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // All cases are covered, so this is just to avoid warnings.
            return fn(nil);
        case value_type::BOOLEAN:
            return fn(cast<bool>(v));
        case value_type::INTEGER:
            return fn(cast<integer>(v));
        case value_type::FLOAT:
            return fn(cast<double>(v));
        case value_type::STRING:
            return fn(cast<string>(v));
        case value_type::DATETIME:
            return fn(cast<ptime>(v));
        case value_type::OBJECT_ID:
            return fn(cast<object_id>(v));
        case value_type::ARRAY:
            return fn(cast<dynamic_array>(v));
        case value_type::MAP:
            return fn(cast<dynamic_map>(v));
    }
}

// Apply the functor fn to two values of the same type.
// If a and b are not the same type, this throws a type_mismatch exception.
template<class Fn>
auto
apply_to_dynamic_pair(Fn&& fn, dynamic const& a, dynamic const& b)
{
    check_type(a.type(), b.type());
    switch (a.type())
    {
        case value_type::NIL:
        default: // All cases are covered, so this is just to avoid warnings.
            return fn(nil, nil);
        case value_type::BOOLEAN:
            return fn(cast<bool>(a), cast<bool>(b));
        case value_type::INTEGER:
            return fn(cast<integer>(a), cast<integer>(b));
        case value_type::FLOAT:
            return fn(cast<double>(a), cast<double>(b));
        case value_type::STRING:
            return fn(cast<string>(a), cast<string>(b));
        case value_type::DATETIME:
            return fn(cast<ptime>(a), cast<ptime>(b));
        case value_type::OBJECT_ID:
            return fn(cast<object_id>(a), cast<object_id>(b));
        case value_type::ARRAY:
            return fn(cast<dynamic_array>(a), cast<dynamic_array>(b));
        case value_type::MAP:
            return fn(cast<dynamic_map>(a), cast<dynamic_map>(b));
    }
}

// This is a generic function for reading a field from a dynamic_map.
template<class Field>
void
read_field_from_record(
    Field* field_value, dynamic_map const& record, string const& field_name)
{
    auto const& dynamic_field_value = get_field(record, field_name);
    try
    {
        from_dynamic(field_value, dynamic_field_value);
    }
    catch (boost::exception& e)
    {
        chronicle::add_dynamic_path_element(e, field_name);
        throw;
    }
}

// Same, but the field may be omitted, in which case :field_value is left
// untouched.
template<class Field>
void
read_optional_field_from_record(
    Field* field_value, dynamic_map const& record, string const& field_name)
{
    dynamic const* dynamic_field_value;
    if (!get_field(&dynamic_field_value, record, field_name))
        return;
    try
    {
        from_dynamic(field_value, *dynamic_field_value);
    }
    catch (boost::exception& e)
    {
        chronicle::add_dynamic_path_element(e, field_name);
        throw;
    }
}

// This is a generic function for writing a field to a dynamic_map.
template<class Field>
void
write_field_to_record(
    dynamic_map& record, std::string field_name, Field const& field_value)
{
    to_dynamic(&record[field_name], field_value);
}

} // namespace chronicle

#endif
