#ifndef CHRONICLE_PATCH_PATH_HPP
#define CHRONICLE_PATCH_PATH_HPP

#include <iosfwd>
#include <vector>

#include <chronicle/core/dynamic.hpp>

namespace chronicle {

// PATHS - A patch_path locates a value inside a document. It's the sequence
// of segments of a JSON pointer (RFC 6901), already unescaped. Map fields are
// addressed by key and array items by their (decimal) index, so segments are
// always strings.
typedef std::vector<string> patch_path;

// Parse a JSON pointer string.
// A single leading '/' is stripped. The root path ("" or "/") is the empty
// sequence. "~1" is unescaped to '/' and "~0" to '~'.
patch_path
parse_path(string const& pointer);

// Write a path as a JSON pointer string. This is the inverse of parse_path.
string
format_path(patch_path const& path);

// Does :segment name an array index (i.e., is it a non-negative integer)?
bool
is_array_index(string const& segment);

// Get the array index named by :segment.
// This assumes that is_array_index(segment) is true.
size_t
to_array_index(string const& segment);

// PATTERNS - A path_pattern is like a patch_path except that individual
// segments may be the wildcard '*', which stands for any array index.

struct pattern_segment
{
    bool wildcard = false;
    // only meaningful if :wildcard is false
    string literal;
};

bool
operator==(pattern_segment const& a, pattern_segment const& b);
bool
operator!=(pattern_segment const& a, pattern_segment const& b);

pattern_segment
make_literal_segment(string const& literal);

pattern_segment
make_wildcard_segment();

typedef std::vector<pattern_segment> path_pattern;

// Parse a pattern string like "/object/array/*/hidden".
// Empty segments (e.g., from doubled or trailing slashes) are dropped, so
// "//a//b/" is the same pattern as "/a/b".
path_pattern
parse_path_pattern(string const& pattern);

string
format_path_pattern(path_pattern const& pattern);

std::ostream&
operator<<(std::ostream& s, path_pattern const& pattern);

// Does a single pattern segment match a concrete segment?
bool
segment_matches(pattern_segment const& pattern, string const& segment);

// Does :pattern match :path exactly (same length, all segments match)?
bool
pattern_matches(path_pattern const& pattern, patch_path const& path);

// Does :pattern cover :path, either exactly or as a prefix of it?
bool
pattern_contains(path_pattern const& pattern, patch_path const& path);

// Is :path a proper prefix of something that :pattern could match?
// In other words, is :pattern longer than :path, with its leading segments
// matching :path? This is the case in which :pattern reaches into the value
// that an operation at :path carries.
bool
pattern_extends(path_pattern const& pattern, patch_path const& path);

// VALUE LOOKUP

// Find the value at :path within :root.
// Map segments are looked up by key, and array segments by index. If the path
// doesn't exist, this returns a null pointer.
dynamic const*
find_value_at_path(dynamic const& root, patch_path const& path);

} // namespace chronicle

#endif
