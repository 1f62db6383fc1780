#ifndef CHRONICLE_CORE_UTILITIES_HPP
#define CHRONICLE_CORE_UTILITIES_HPP

#include <map>
#include <string>
#include <vector>

#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>

#include <chronicle/core/exception.hpp>

namespace chronicle {

using std::string;

using boost::lexical_cast;
using boost::none;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

// CHRONICLE_LAMBDIFY(f) produces a lambda that calls f, which is essentially a
// version of f that can be passed as an argument and still allows normal
// overload resolution.
#define CHRONICLE_LAMBDIFY(f) [](auto&&... args) { return f(args...); }

// invalid_enum_value is thrown when an enum's raw (integer) value is invalid.
CHRONICLE_DEFINE_EXCEPTION(invalid_enum_value)
CHRONICLE_DEFINE_ERROR_INFO(string, enum_id)
CHRONICLE_DEFINE_ERROR_INFO(int, enum_value)

// invalid_enum_string is thrown when attempting to convert a string value to
// an enum and the string doesn't match any of the enum's cases.
CHRONICLE_DEFINE_EXCEPTION(invalid_enum_string)
// Note that this also uses the enum_id info declared above.
CHRONICLE_DEFINE_ERROR_INFO(string, enum_string)

// If a simple parsing operation fails, this exception can be thrown.
CHRONICLE_DEFINE_EXCEPTION(parsing_error)
CHRONICLE_DEFINE_ERROR_INFO(string, expected_format)
CHRONICLE_DEFINE_ERROR_INFO(string, parsed_text)
CHRONICLE_DEFINE_ERROR_INFO(string, parsing_error)

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
CHRONICLE_DEFINE_ERROR_INFO(string, internal_error_message)

// Get the value of an optional environment variable.
// If the variable isn't set, this simply returns none.
optional<string>
get_optional_environment_variable(string const& name);

// functional map over a vector
template<class Item, class Fn>
auto
map(Fn const& fn, std::vector<Item> const& items)
{
    typedef decltype(fn(std::declval<Item const&>())) mapped_item_type;
    std::vector<mapped_item_type> result;
    result.reserve(items.size());
    for (auto const& item : items)
        result.push_back(fn(item));
    return result;
}

// functional map over a map, producing a vector
template<class Key, class Value, class Fn>
auto
map_to_vector(Fn const& fn, std::map<Key, Value> const& items)
{
    typedef decltype(fn(*items.begin())) mapped_item_type;
    std::vector<mapped_item_type> result;
    result.reserve(items.size());
    for (auto const& item : items)
        result.push_back(fn(item));
    return result;
}

} // namespace chronicle

#endif
