#include <chronicle/encodings/json.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <chronicle/core/testing.hpp>

using namespace chronicle;

static string
strip_whitespace(string s)
{
    s.erase(std::remove_if(s.begin(), s.end(), isspace), s.end());
    return s;
}

// Test that a JSON string can be translated to and from its expected dynamic
// form.
static void
test_json_encoding(string const& json, dynamic const& expected_value)
{
    CAPTURE(json);

    // Parse it and check that it matches.
    auto converted_value = parse_json_value(json);
    REQUIRE(converted_value == expected_value);

    // Convert it back to JSON and check that that matches the original (modulo
    // whitespace).
    auto converted_json = value_to_json(converted_value);
    REQUIRE(strip_whitespace(converted_json) == strip_whitespace(json));

    // The compact form is the same thing on one line.
    auto compact_json = value_to_compact_json(converted_value);
    REQUIRE(compact_json.find('\n') == string::npos);
    REQUIRE(strip_whitespace(compact_json) == strip_whitespace(json));
}

TEST_CASE("basic JSON encoding", "[encodings][json]")
{
    // Try some basic types.
    test_json_encoding(
        R"(
            null
        )",
        nil);
    test_json_encoding(
        R"(
            false
        )",
        false);
    test_json_encoding(
        R"(
            true
        )",
        true);
    test_json_encoding(
        R"(
            1
        )",
        integer(1));
    test_json_encoding(
        R"(
            10737418240
        )",
        integer(10737418240));
    test_json_encoding(
        R"(
            -1
        )",
        integer(-1));
    test_json_encoding(
        R"(
            1.25
        )",
        1.25);
    test_json_encoding(
        R"(
            "hi"
        )",
        "hi");

    // Try some arrays.
    test_json_encoding(
        R"(
            [ 1, 2, 3 ]
        )",
        dynamic({integer(1), integer(2), integer(3)}));
    test_json_encoding(
        R"(
            []
        )",
        dynamic_array());

    // Try some maps.
    test_json_encoding(
        R"(
            {
                "happy": true,
                "n": 4.125
            }
        )",
        dynamic_map{{"happy", true}, {"n", 4.125}});
    test_json_encoding(
        R"(
            {}
        )",
        dynamic_map());
    test_json_encoding(
        R"(
            [
                {
                    "key": false
                },
                {
                    "key": true
                }
            ]
        )",
        dynamic_array{dynamic_map{{"key", false}}, dynamic_map{{"key", true}}});
}

TEST_CASE("JSON field order", "[encodings][json]")
{
    // Fields come back out in the order they were read.
    auto json = R"(
        {
            "zebra": 1,
            "apple": {
                "y": 2,
                "b": 3
            },
            "mango": 4
        }
    )";
    auto value = parse_json_value(json);
    auto const& map = cast<dynamic_map>(value);
    REQUIRE(map.begin()->first == "zebra");
    REQUIRE(std::prev(map.end())->first == "mango");
    REQUIRE(strip_whitespace(value_to_json(value)) == strip_whitespace(json));

    // The same goes for maps built in code.
    dynamic_map built;
    built["b"] = integer(1);
    built["a"] = integer(2);
    REQUIRE(value_to_compact_json(built) == R"({"b":1,"a":2})");
}

TEST_CASE("JSON object_id encoding", "[encodings][json]")
{
    auto id = parse_object_id("507f1f77bcf86cd799439011");
    test_json_encoding(
        R"(
            {
                "$oid": "507f1f77bcf86cd799439011"
            }
        )",
        id);
    test_json_encoding(
        R"(
            {
                "_id": {
                    "$oid": "507f1f77bcf86cd799439011"
                },
                "ref": "507f1f77bcf86cd799439011"
            }
        )",
        dynamic_map{{"_id", id}, {"ref", "507f1f77bcf86cd799439011"}});

    // Things that look like identifiers but aren't are read as maps.
    test_json_encoding(
        R"(
            {
                "$oid": "xyz"
            }
        )",
        dynamic_map{{"$oid", "xyz"}});
    test_json_encoding(
        R"(
            {
                "$oid": "507f1f77bcf86cd799439011",
                "extra": 1
            }
        )",
        dynamic_map{
            {"$oid", "507f1f77bcf86cd799439011"}, {"extra", integer(1)}});
    test_json_encoding(
        R"(
            {
                "$oid": 12
            }
        )",
        dynamic_map{{"$oid", integer(12)}});
}

TEST_CASE("JSON datetime encoding", "[encodings][json]")
{
    // Try some ptimes.
    test_json_encoding(
        R"(
            "2017-04-26T01:02:03.000Z"
        )",
        ptime(
            boost::gregorian::date(2017, boost::gregorian::Apr, 26),
            boost::posix_time::time_duration(1, 2, 3)));
    test_json_encoding(
        R"(
            "2017-05-26T13:02:03.456Z"
        )",
        ptime(
            boost::gregorian::date(2017, boost::gregorian::May, 26),
            boost::posix_time::time_duration(13, 2, 3)
                + boost::posix_time::milliseconds(456)));

    // Try some thing that look like a ptime at first and check that they're
    // just treated as strings.
    for (auto const& not_a_time :
         {"2017-05-26T13:13:03.456ZABC",
          "2017-05-26T13:XX:03.456Z",
          "2017-05-26T13:03.456Z",
          "2017-05-26T42:00:03.456Z",
          "X017-05-26T13:02:03.456Z",
          "2017X05-26T13:02:03.456Z",
          "2017-05-26T13:02:03.456_",
          "2017-05-26T13:02:03.45Z"})
    {
        test_json_encoding(
            "\"" + string(not_a_time) + "\"", dynamic(string(not_a_time)));
    }
}

static void
test_malformed_json(string const& malformed_json)
{
    CAPTURE(malformed_json);

    try
    {
        parse_json_value(malformed_json);
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<expected_format_info>(e) == "JSON");
        REQUIRE(
            get_required_error_info<parsed_text_info>(e) == malformed_json);
        REQUIRE(!get_required_error_info<parsing_error_info>(e).empty());
    }
}

TEST_CASE("malformed JSON", "[encodings][json]")
{
    test_malformed_json(
        R"(
            asdf
        )");
    test_malformed_json(
        R"(
            asdf: 123
        )");
    test_malformed_json(
        R"(
            { "a": [1, 2 }
        )");
}
