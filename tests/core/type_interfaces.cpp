#include <chronicle/core/type_interfaces.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <chronicle/core/testing.hpp>

using namespace chronicle;

TEST_CASE("bool type interface", "[core][types]")
{
    test_dynamic_interface(false, dynamic(false));
    test_dynamic_interface(true, dynamic(true));

    REQUIRE_THROWS_AS(from_dynamic<bool>(dynamic(integer(1))), type_mismatch);
}

template<class Integer>
void
test_integer_interface()
{
    test_dynamic_interface(Integer(0), dynamic(integer(0)));
    test_dynamic_interface(Integer(12), dynamic(integer(12)));

    // Floats are accepted if they convert cleanly.
    REQUIRE(from_dynamic<Integer>(dynamic(4.)) == Integer(4));
}

TEST_CASE("integer type interfaces", "[core][types]")
{
    test_integer_interface<signed int>();
    test_integer_interface<unsigned int>();
    test_integer_interface<signed long>();
    test_integer_interface<unsigned long>();
    test_integer_interface<signed long long>();
    test_integer_interface<unsigned long long>();

    // Negative values can't be read into unsigned integers.
    REQUIRE_THROWS(from_dynamic<unsigned int>(dynamic(integer(-1))));
}

TEST_CASE("float type interface", "[core][types]")
{
    test_dynamic_interface(0.5, dynamic(0.5));

    // Integers are also acceptable as floats.
    REQUIRE(from_dynamic<double>(dynamic(integer(3))) == 3.);
}

TEST_CASE("string type interface", "[core][types]")
{
    test_dynamic_interface(string("hello"), dynamic("hello"));

    // Datetimes and identifiers are read back as their string forms.
    auto time = ptime(
        boost::gregorian::date(2017, boost::gregorian::Apr, 26),
        boost::posix_time::time_duration(1, 2, 3));
    REQUIRE(from_dynamic<string>(dynamic(time)) == "2017-04-26T01:02:03.000Z");
    auto id = parse_object_id("507f1f77bcf86cd799439011");
    REQUIRE(from_dynamic<string>(dynamic(id)) == "507f1f77bcf86cd799439011");
}

TEST_CASE("ptime type interface", "[core][types]")
{
    auto time = ptime(
        boost::gregorian::date(2017, boost::gregorian::May, 26),
        boost::posix_time::time_duration(13, 2, 3)
            + boost::posix_time::milliseconds(456));
    test_dynamic_interface(time, dynamic(time));

    REQUIRE(to_value_string(time) == "2017-05-26T13:02:03.456Z");
    REQUIRE(parse_ptime("2017-05-26T13:02:03.456Z") == time);
    REQUIRE(from_dynamic<ptime>(dynamic("2017-05-26T13:02:03.456Z")) == time);

    // Try parsing some malformed times.
    for (auto const& malformed :
         {"asdf", "2017-05-26T13:02:03.456", "2017-05-26T13:02:03.456Zx"})
    {
        CAPTURE(malformed);
        try
        {
            parse_ptime(malformed);
            FAIL("no exception thrown");
        }
        catch (parsing_error& e)
        {
            REQUIRE(
                get_required_error_info<expected_format_info>(e)
                == "datetime");
            REQUIRE(
                get_required_error_info<parsed_text_info>(e) == malformed);
        }
    }
}

TEST_CASE("current time", "[core][types]")
{
    auto now = get_current_time();
    // The current time is truncated to milliseconds, so it survives a trip
    // through its string form.
    REQUIRE(parse_ptime(to_value_string(now)) == now);
    REQUIRE(now.time_of_day().fractional_seconds() % 1000 == 0);
}

TEST_CASE("object_id type interface", "[core][types]")
{
    auto id = parse_object_id("507f1f77bcf86cd799439011");
    test_dynamic_interface(id, dynamic(id));

    // The string form is also accepted.
    REQUIRE(
        from_dynamic<object_id>(dynamic("507f1f77bcf86cd799439011")) == id);
    REQUIRE_THROWS_AS(
        from_dynamic<object_id>(dynamic("not an id")), invalid_object_id);
}

TEST_CASE("vector type interface", "[core][types]")
{
    test_dynamic_interface(
        std::vector<string>{"a", "b"}, dynamic(dynamic_array{"a", "b"}));
    test_dynamic_interface(std::vector<string>(), dynamic(dynamic_array()));

    // Errors inside the vector are tagged with the index of the bad item.
    try
    {
        from_dynamic<std::vector<string>>(
            dynamic(dynamic_array{"a", "b", integer(3)}));
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<dynamic_value_path_info>(e)
            == std::list<dynamic>({integer(2)}));
    }
}

TEST_CASE("optional type interface", "[core][types]")
{
    test_dynamic_interface(optional<string>(), dynamic(nil));
    test_dynamic_interface(some(string("x")), dynamic("x"));
}
