#include <chronicle/encodings/json.hpp>

#include <mutex>

#include <boost/numeric/conversion/cast.hpp>

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <chronicle/core/type_interfaces.hpp>

namespace chronicle {

// JSON I/O

static bool
safe_isdigit(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch));
}

// Check if a JSON object is actually an encoded object_id.
static bool
object_resembles_object_id(simdjson::dom::object const& object)
{
    if (object.size() != 1)
        return false;
    auto oid = object.at_key("$oid");
    return oid.error() != simdjson::NO_SUCH_FIELD && oid.value().is_string();
}

// Read a JSON value into a Chronicle dynamic.
static dynamic
read_json_value(simdjson::dom::element const& json)
{
    switch (json.type())
    {
        case simdjson::dom::element_type::NULL_VALUE:
        default: // to avoid warnings
            return nil;
        case simdjson::dom::element_type::BOOL:
            return bool(json);
        case simdjson::dom::element_type::INT64:
            return boost::numeric_cast<integer>(int64_t(json));
        case simdjson::dom::element_type::UINT64:
            return boost::numeric_cast<integer>(uint64_t(json));
        case simdjson::dom::element_type::DOUBLE:
            return double(json);
        case simdjson::dom::element_type::STRING: {
            // Times are also encoded as JSON strings, so this checks to see if
            // the string parses as a time. If so, it just assumes it's
            // actually a time.
            auto s = json.get_string().value();
            // First check if it looks anything like a time string.
            if (s.length() > 16 && safe_isdigit(s[0]) && safe_isdigit(s[1])
                && safe_isdigit(s[2]) && safe_isdigit(s[3]) && s[4] == '-')
            {
                try
                {
                    auto t = parse_ptime(string(s));
                    // Check that it can be converted back without changing its
                    // value. This could be necessary if we actually expected a
                    // string here.
                    if (to_value_string(t) == s)
                    {
                        return t;
                    }
                }
                catch (parsing_error&)
                {
                }
            }
            return string(s);
        }
        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array source = json;
            dynamic_array array;
            array.reserve(source.size());
            for (auto const& i : source)
            {
                array.push_back(read_json_value(i));
            }
            return array;
        }
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object object = json;
            if (object_resembles_object_id(object))
            {
                auto hex = object.at_key("$oid").value().get_string().value();
                try
                {
                    return parse_object_id(string(hex));
                }
                catch (invalid_object_id&)
                {
                    // Not a real identifier, so fall through and read it as
                    // an ordinary map.
                }
            }
            dynamic_map map;
            for (auto const& i : object)
            {
                map[string(i.key)] = read_json_value(i.value);
            }
            return map;
        }
    }
}

dynamic
parse_json_value(char const* json, size_t length)
{
    static simdjson::dom::parser the_parser;
    static std::mutex the_mutex;

    std::lock_guard<std::mutex> guard(the_mutex);

    simdjson::dom::element doc;
    try
    {
        doc = the_parser.parse(json, length);
    }
    catch (std::exception& e)
    {
        CHRONICLE_THROW(
            parsing_error() << expected_format_info("JSON")
                            << parsed_text_info(string(json, json + length))
                            << parsing_error_info(e.what()));
    }
    return read_json_value(doc);
}

static nlohmann::ordered_json
to_nlohmann_json(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // to avoid warnings
            return nullptr;
        case value_type::BOOLEAN:
            return cast<bool>(v);
        case value_type::INTEGER:
            return cast<integer>(v);
        case value_type::FLOAT:
            return cast<double>(v);
        case value_type::STRING:
            return cast<string>(v);
        case value_type::DATETIME:
            return to_value_string(cast<ptime>(v));
        case value_type::OBJECT_ID: {
            nlohmann::ordered_json json;
            json["$oid"] = to_string(cast<object_id>(v));
            return json;
        }
        case value_type::ARRAY: {
            nlohmann::ordered_json json(nlohmann::ordered_json::value_t::array);
            for (auto const& i : cast<dynamic_array>(v))
            {
                json.push_back(to_nlohmann_json(i));
            }
            return json;
        }
        case value_type::MAP: {
            nlohmann::ordered_json json(
                nlohmann::ordered_json::value_t::object);
            for (auto const& i : cast<dynamic_map>(v))
            {
                json[i.first] = to_nlohmann_json(i.second);
            }
            return json;
        }
    }
}

string
value_to_json(dynamic const& v)
{
    return to_nlohmann_json(v).dump(4);
}

string
value_to_compact_json(dynamic const& v)
{
    return to_nlohmann_json(v).dump();
}

} // namespace chronicle
