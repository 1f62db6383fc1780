#ifndef CHRONICLE_CORE_TYPE_INTERFACES_HPP
#define CHRONICLE_CORE_TYPE_INTERFACES_HPP

#include <map>
#include <vector>

#include <chronicle/core/dynamic.hpp>

namespace chronicle {

// This file provides the to_dynamic/from_dynamic interface for the C++ types
// that appear in Chronicle structures.

// BOOL

void
to_dynamic(dynamic* v, bool x);

void
from_dynamic(bool* x, dynamic const& v);

// STRING

void
to_dynamic(dynamic* v, string const& x);

void
from_dynamic(string* x, dynamic const& v);

// INTEGERS

#define CHRONICLE_DECLARE_INTEGER_INTERFACE(T)                                \
    void to_dynamic(dynamic* v, T x);                                         \
    void from_dynamic(T* x, dynamic const& v);

CHRONICLE_DECLARE_INTEGER_INTERFACE(signed int)
CHRONICLE_DECLARE_INTEGER_INTERFACE(unsigned int)
CHRONICLE_DECLARE_INTEGER_INTERFACE(signed long)
CHRONICLE_DECLARE_INTEGER_INTERFACE(unsigned long)
CHRONICLE_DECLARE_INTEGER_INTERFACE(signed long long)
CHRONICLE_DECLARE_INTEGER_INTERFACE(unsigned long long)

// FLOATS

void
to_dynamic(dynamic* v, double x);

void
from_dynamic(double* x, dynamic const& v);

// PTIME

// Get the preferred user-readable string representation of a ptime.
string
to_string(ptime const& t);

// Get the preferred representation for encoding a ptime as a string.
// (This preserves milliseconds.)
string
to_value_string(ptime const& t);

// Parse a string produced by to_value_string.
ptime
parse_ptime(string const& s);

// Get the current UTC time, truncated to milliseconds (so that it survives a
// trip through to_value_string).
ptime
get_current_time();

void
to_dynamic(dynamic* v, ptime const& x);

void
from_dynamic(ptime* x, dynamic const& v);

// OBJECT IDS

void
to_dynamic(dynamic* v, object_id const& x);

// This also accepts the string form of an object_id.
void
from_dynamic(object_id* x, dynamic const& v);

// MAPS

inline void
to_dynamic(dynamic* v, dynamic_map const& x)
{
    *v = x;
}

inline void
from_dynamic(dynamic_map* x, dynamic const& v)
{
    *x = cast<dynamic_map>(v);
}

// VECTORS

template<class T>
void
to_dynamic(dynamic* v, std::vector<T> const& x)
{
    dynamic_array array;
    array.reserve(x.size());
    for (auto const& item : x)
        array.push_back(to_dynamic(item));
    *v = std::move(array);
}

template<class T>
void
from_dynamic(std::vector<T>* x, dynamic const& v)
{
    auto const& array = cast<dynamic_array>(v);
    x->clear();
    x->reserve(array.size());
    integer index = 0;
    for (auto const& item : array)
    {
        try
        {
            x->push_back(from_dynamic<T>(item));
        }
        catch (boost::exception& e)
        {
            chronicle::add_dynamic_path_element(e, index);
            throw;
        }
        ++index;
    }
}

// OPTIONALS - Optional values are encoded as either nil or the value itself.

template<class T>
void
to_dynamic(dynamic* v, optional<T> const& x)
{
    if (x)
        to_dynamic(v, *x);
    else
        *v = nil;
}

template<class T>
void
from_dynamic(optional<T>* x, dynamic const& v)
{
    if (v.type() == value_type::NIL)
        *x = none;
    else
        *x = from_dynamic<T>(v);
}

} // namespace chronicle

#endif
