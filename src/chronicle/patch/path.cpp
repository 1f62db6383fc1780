#include <chronicle/patch/path.hpp>

#include <ostream>

#include <boost/algorithm/string/split.hpp>

namespace chronicle {

static string
unescape_segment(string const& segment)
{
    string unescaped;
    unescaped.reserve(segment.length());
    for (size_t i = 0; i != segment.length(); ++i)
    {
        if (segment[i] == '~' && i + 1 != segment.length())
        {
            if (segment[i + 1] == '1')
            {
                unescaped.push_back('/');
                ++i;
                continue;
            }
            if (segment[i + 1] == '0')
            {
                unescaped.push_back('~');
                ++i;
                continue;
            }
        }
        unescaped.push_back(segment[i]);
    }
    return unescaped;
}

static string
escape_segment(string const& segment)
{
    string escaped;
    escaped.reserve(segment.length());
    for (auto c : segment)
    {
        switch (c)
        {
            case '~':
                escaped += "~0";
                break;
            case '/':
                escaped += "~1";
                break;
            default:
                escaped.push_back(c);
        }
    }
    return escaped;
}

static std::vector<string>
split_pointer(string const& pointer)
{
    string body = pointer;
    if (!body.empty() && body[0] == '/')
        body.erase(0, 1);
    std::vector<string> segments;
    if (body.empty())
        return segments;
    boost::algorithm::split(
        segments, body, [](char c) { return c == '/'; });
    return segments;
}

patch_path
parse_path(string const& pointer)
{
    patch_path path;
    for (auto const& segment : split_pointer(pointer))
        path.push_back(unescape_segment(segment));
    return path;
}

string
format_path(patch_path const& path)
{
    string pointer;
    for (auto const& segment : path)
    {
        pointer.push_back('/');
        pointer += escape_segment(segment);
    }
    return pointer;
}

bool
is_array_index(string const& segment)
{
    if (segment.empty() || segment.length() > 18)
        return false;
    for (auto c : segment)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    // Leading zeros are allowed, so "01" names index 1.
    return true;
}

size_t
to_array_index(string const& segment)
{
    return lexical_cast<size_t>(segment);
}

bool
operator==(pattern_segment const& a, pattern_segment const& b)
{
    return a.wildcard == b.wildcard && (a.wildcard || a.literal == b.literal);
}
bool
operator!=(pattern_segment const& a, pattern_segment const& b)
{
    return !(a == b);
}

pattern_segment
make_literal_segment(string const& literal)
{
    pattern_segment segment;
    segment.wildcard = false;
    segment.literal = literal;
    return segment;
}

pattern_segment
make_wildcard_segment()
{
    pattern_segment segment;
    segment.wildcard = true;
    return segment;
}

path_pattern
parse_path_pattern(string const& pattern)
{
    path_pattern parsed;
    for (auto const& segment : split_pointer(pattern))
    {
        if (segment.empty())
            continue;
        if (segment == "*")
            parsed.push_back(make_wildcard_segment());
        else
            parsed.push_back(make_literal_segment(unescape_segment(segment)));
    }
    return parsed;
}

string
format_path_pattern(path_pattern const& pattern)
{
    string formatted;
    for (auto const& segment : pattern)
    {
        formatted.push_back('/');
        formatted += segment.wildcard ? string("*")
                                      : escape_segment(segment.literal);
    }
    return formatted;
}

std::ostream&
operator<<(std::ostream& s, path_pattern const& pattern)
{
    s << format_path_pattern(pattern);
    return s;
}

bool
segment_matches(pattern_segment const& pattern, string const& segment)
{
    return pattern.wildcard ? is_array_index(segment)
                            : pattern.literal == segment;
}

// Do the first :n segments of :pattern match those of :path?
static bool
leading_segments_match(
    path_pattern const& pattern, patch_path const& path, size_t n)
{
    for (size_t i = 0; i != n; ++i)
    {
        if (!segment_matches(pattern[i], path[i]))
            return false;
    }
    return true;
}

bool
pattern_matches(path_pattern const& pattern, patch_path const& path)
{
    return pattern.size() == path.size()
           && leading_segments_match(pattern, path, pattern.size());
}

bool
pattern_contains(path_pattern const& pattern, patch_path const& path)
{
    return pattern.size() <= path.size()
           && leading_segments_match(pattern, path, pattern.size());
}

bool
pattern_extends(path_pattern const& pattern, patch_path const& path)
{
    return pattern.size() > path.size()
           && leading_segments_match(pattern, path, path.size());
}

dynamic const*
find_value_at_path(dynamic const& root, patch_path const& path)
{
    dynamic const* current = &root;
    for (auto const& segment : path)
    {
        switch (current->type())
        {
            case value_type::MAP: {
                auto const& map = cast<dynamic_map>(*current);
                auto field = map.find(segment);
                if (field == map.end())
                    return nullptr;
                current = &field->second;
                break;
            }
            case value_type::ARRAY: {
                auto const& array = cast<dynamic_array>(*current);
                if (!is_array_index(segment))
                    return nullptr;
                auto index = to_array_index(segment);
                if (index >= array.size())
                    return nullptr;
                current = &array[index];
                break;
            }
            default:
                return nullptr;
        }
    }
    return current;
}

} // namespace chronicle
