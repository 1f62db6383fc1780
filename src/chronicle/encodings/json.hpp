#ifndef CHRONICLE_ENCODINGS_JSON_HPP
#define CHRONICLE_ENCODINGS_JSON_HPP

#include <chronicle/core/type_definitions.hpp>

// JSON - conversion to and from JSON strings
//
// Object identifiers are written in extended JSON form ({"$oid": "<hex>"}) so
// that they survive a round trip. Datetimes are written as value strings and
// are recognized again when parsed.

namespace chronicle {

// Parse some JSON text into a dynamic value.
// Object fields keep the order in which they appear in the text.
dynamic
parse_json_value(char const* json, size_t length);

// Same as above, but accepts a string.
inline dynamic
parse_json_value(string const& json)
{
    return parse_json_value(json.c_str(), json.length());
}

// Write a value to a string in (indented) JSON format.
string
value_to_json(dynamic const& v);

// Write a value to a single-line JSON string.
string
value_to_compact_json(dynamic const& v);

} // namespace chronicle

#endif
