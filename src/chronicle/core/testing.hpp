#ifndef CHRONICLE_CORE_TESTING_HPP
#define CHRONICLE_CORE_TESTING_HPP

#include <cstdlib>

#include <boost/optional/optional_io.hpp>

#include <catch.hpp>

#include <chronicle/core/type_interfaces.hpp>

namespace chronicle {

// Test that a type's dynamic interface produces :expected for :x and reads
// :x back from :expected.
template<class T>
void
test_dynamic_interface(T const& x, dynamic const& expected)
{
    {
        INFO("to_dynamic should produce the expected dynamic value.")
        REQUIRE(to_dynamic(x) == expected);
    }

    {
        INFO("from_dynamic should read the original value back.")
        REQUIRE(from_dynamic<T>(expected) == x);
    }
}

// Set (or, if :value is empty, clear) an environment variable for the
// duration of a test.
inline void
set_environment_variable(string const& name, string const& value)
{
    if (value.empty())
        unsetenv(name.c_str());
    else
        setenv(name.c_str(), value.c_str(), 1);
}

} // namespace chronicle

namespace Catch {

// Let Catch print optionals of types (like vectors) that boost's optional_io
// can't stream.
template<class T>
struct StringMaker<boost::optional<T>>
{
    static std::string
    convert(boost::optional<T> const& x)
    {
        return x ? ::Catch::Detail::stringify(*x) : "--";
    }
};

} // namespace Catch

#endif
