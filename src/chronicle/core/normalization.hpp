#ifndef CHRONICLE_CORE_NORMALIZATION_HPP
#define CHRONICLE_CORE_NORMALIZATION_HPP

#include <chronicle/core/dynamic.hpp>

namespace chronicle {

// NORMALIZATION - Stores hand out values that contain opaque types (object
// identifiers, datetimes). Before two values are compared for the purposes of
// change tracking, those are rendered to their canonical string forms so that
// the same logical value never shows up as two different representations.

// Get the normalized form of a value.
// Object identifiers become their hex strings and datetimes become their
// value strings. Everything else is copied as is (recursively).
dynamic
normalize_value(dynamic const& v);

dynamic_map
normalize_map(dynamic_map const& map);

// Is :v already in normalized form?
bool
is_normalized(dynamic const& v);

// Compare two values that are already in normalized form.
// Unlike operator==, this treats an integer and a float as equal if they
// have the same numeric value (as JSON does).
bool
normalized_equal(dynamic const& a, dynamic const& b);

// Compare two values after normalizing them (using normalized_equal).
bool
equivalent(dynamic const& a, dynamic const& b);

} // namespace chronicle

#endif
