#include <chronicle/core/exception.hpp>

#include <chronicle/core/testing.hpp>

using namespace chronicle;

TEST_CASE("error info", "[core][exception]")
{
    parsing_error error;
    error << parsed_text_info("asdf");

    REQUIRE(get_required_error_info<parsed_text_info>(error) == "asdf");

    try
    {
        get_required_error_info<expected_format_info>(error);
        FAIL("no exception thrown");
    }
    catch (missing_error_info& e)
    {
        get_required_error_info<error_info_id_info>(e);
        REQUIRE(
            !get_required_error_info<wrapped_exception_diagnostics_info>(e)
                 .empty());
    }
}

TEST_CASE("thrown exceptions", "[core][exception]")
{
    try
    {
        CHRONICLE_THROW(
            parsing_error() << expected_format_info("JSON")
                            << parsed_text_info("]"));
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<expected_format_info>(e) == "JSON");
        // Thrown exceptions carry a stack trace.
        REQUIRE(get_error_info<stacktrace_info>(e));
        // what() describes the attached info.
        REQUIRE(string(e.what()).find("JSON") != string::npos);
    }
}
