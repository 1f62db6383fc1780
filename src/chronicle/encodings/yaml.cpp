#include <chronicle/encodings/yaml.hpp>

#include <sstream>

#include <boost/lexical_cast.hpp>

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop
#else
#include <yaml-cpp/yaml.h>
#endif

#include <chronicle/core/type_interfaces.hpp>

namespace chronicle {

// YAML I/O

static bool
safe_isdigit(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch));
}

// Read a YAML value into a Chronicle dynamic.
static dynamic
read_yaml_value(YAML::Node const& yaml)
{
    switch (yaml.Type())
    {
        case YAML::NodeType::Null:
        default: // to avoid warnings
            return nil;
        case YAML::NodeType::Scalar: {
            // This case captures strings, booleans, integers, and doubles.
            // First, check to see if the value was explicitly quoted.
            if (yaml.Tag() == "!")
            {
                // Times are also encoded as quoted strings, so this checks to
                // see if the string parses as a time. If so, it just assumes
                // it's actually a time.
                auto s = yaml.as<string>();
                // First check if it looks anything like a time string.
                if (s.length() > 16 && safe_isdigit(s[0]) && safe_isdigit(s[1])
                    && safe_isdigit(s[2]) && safe_isdigit(s[3]) && s[4] == '-')
                {
                    try
                    {
                        auto t = parse_ptime(s);
                        // Check that it can be converted back without changing
                        // its value. This could be necessary if we actually
                        // expected a string here.
                        if (to_value_string(t) == s)
                        {
                            return t;
                        }
                    }
                    catch (parsing_error&)
                    {
                    }
                }
                return s;
            }
            else // The value wasn't quoted.
            {
                auto s = yaml.as<string>();
                // Try to interpret it as a boolean.
                if (s == "true")
                    return true;
                if (s == "false")
                    return false;
                if (s == "null" || s == "~")
                    return nil;
                // Try to interpret it as a number.
                if (!s.compare(0, 2, "0x"))
                {
                    std::istringstream stream(s.substr(2));
                    integer i;
                    stream >> std::hex >> i;
                    if (!stream.fail() && stream.tellg() == std::streampos(-1))
                    {
                        return i;
                    }
                }
                {
                    integer i;
                    if (boost::conversion::try_lexical_convert(s, i))
                    {
                        return i;
                    }
                }
                {
                    double d;
                    if (boost::conversion::try_lexical_convert(s, d))
                    {
                        return d;
                    }
                }
                // If all else fails, it must just be a string.
                return s;
            }
        }
        case YAML::NodeType::Sequence: {
            dynamic_array array;
            array.reserve(yaml.size());
            for (auto const& i : yaml)
            {
                array.push_back(read_yaml_value(i));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            dynamic_map map;
            for (YAML::Node::const_iterator i = yaml.begin(); i != yaml.end();
                 ++i)
            {
                map[i->first.as<string>()] = read_yaml_value(i->second);
            }
            return map;
        }
    }
}

dynamic
parse_yaml_value(char const* yaml, size_t length)
{
    YAML::Node parsed_yaml;
    try
    {
        parsed_yaml = YAML::Load(string(yaml, yaml + length));
    }
    catch (std::exception& e)
    {
        CHRONICLE_THROW(
            parsing_error() << expected_format_info("YAML")
                            << parsed_text_info(string(yaml, yaml + length))
                            << parsing_error_info(e.what()));
    }
    return read_yaml_value(parsed_yaml);
}

static void
emit_string(YAML::Emitter& out, string const& s)
{
    if (read_yaml_value(YAML::Node(s)).type() != value_type::STRING)
    {
        // This happens to be a string that looks like some other scalar
        // type, so it should be explicitly quoted.
        out << YAML::DoubleQuoted << s;
    }
    else
    {
        out << s;
    }
}

static void
emit_yaml_value(YAML::Emitter& out, dynamic const& v, bool diagnostic)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // to avoid warnings
            out << YAML::Node();
            break;
        case value_type::BOOLEAN:
            out << cast<bool>(v);
            break;
        case value_type::INTEGER:
            out << cast<integer>(v);
            break;
        case value_type::FLOAT:
            out << cast<double>(v);
            break;
        case value_type::STRING:
            emit_string(out, cast<string>(v));
            break;
        case value_type::DATETIME:
            out << YAML::DoubleQuoted << to_value_string(cast<ptime>(v));
            break;
        case value_type::OBJECT_ID:
            out << to_string(cast<object_id>(v));
            break;
        case value_type::ARRAY: {
            dynamic_array const& array = cast<dynamic_array>(v);
            if (!diagnostic || array.size() < 64)
            {
                out << YAML::BeginSeq;
                for (auto const& i : array)
                {
                    emit_yaml_value(out, i, diagnostic);
                }
                out << YAML::EndSeq;
            }
            else
            {
                out << "<array - size: " + lexical_cast<string>(array.size())
                           + ">";
            }
            break;
        }
        case value_type::MAP: {
            dynamic_map const& x = cast<dynamic_map>(v);
            if (!diagnostic || x.size() < 64)
            {
                out << YAML::BeginMap;
                for (auto const& i : x)
                {
                    out << YAML::Key;
                    emit_string(out, i.first);
                    out << YAML::Value;
                    emit_yaml_value(out, i.second, diagnostic);
                }
                out << YAML::EndMap;
            }
            else
            {
                out << "<map - size: " + lexical_cast<string>(x.size()) + ">";
            }
            break;
        }
    }
}

string
value_to_yaml(dynamic const& v)
{
    YAML::Emitter out;
    out << YAML::FloatPrecision(5);
    out << YAML::DoublePrecision(12);
    emit_yaml_value(out, v, false);
    return out.c_str();
}

string
value_to_diagnostic_yaml(dynamic const& v)
{
    YAML::Emitter out;
    out << YAML::FloatPrecision(5);
    out << YAML::DoublePrecision(12);
    emit_yaml_value(out, v, true);
    return out.c_str();
}

} // namespace chronicle
