#include <chronicle/core/type_interfaces.hpp>

#include <iostream>
#include <sstream>

#include <fmt/format.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/numeric/conversion/cast.hpp>

namespace chronicle {

// BOOL

void
to_dynamic(dynamic* v, bool x)
{
    *v = x;
}

void
from_dynamic(bool* x, dynamic const& v)
{
    *x = cast<bool>(v);
}

// STRING

void
to_dynamic(dynamic* v, string const& x)
{
    *v = x;
}

void
from_dynamic(string* x, dynamic const& v)
{
    // Strings are also used to encode datetimes and identifiers in JSON, so
    // it's possible we might misinterpret a string as one of those.
    if (v.type() == value_type::DATETIME)
        *x = to_value_string(cast<ptime>(v));
    else if (v.type() == value_type::OBJECT_ID)
        *x = to_string(cast<object_id>(v));
    else
        *x = cast<string>(v);
}

// INTEGERS

#define CHRONICLE_DEFINE_INTEGER_INTERFACE(T)                                 \
    void to_dynamic(dynamic* v, T x)                                          \
    {                                                                         \
        *v = boost::numeric_cast<integer>(x);                                 \
    }                                                                         \
    void from_dynamic(T* x, dynamic const& v)                                 \
    {                                                                         \
        /* Floats can also be acceptable as integers if they convert          \
         * properly.                                                          \
         */                                                                   \
        if (v.type() == value_type::FLOAT)                                    \
            *x = boost::numeric_cast<T>(cast<double>(v));                     \
        else                                                                  \
            *x = boost::numeric_cast<T>(cast<integer>(v));                    \
    }

CHRONICLE_DEFINE_INTEGER_INTERFACE(signed int)
CHRONICLE_DEFINE_INTEGER_INTERFACE(unsigned int)
CHRONICLE_DEFINE_INTEGER_INTERFACE(signed long)
CHRONICLE_DEFINE_INTEGER_INTERFACE(unsigned long)
CHRONICLE_DEFINE_INTEGER_INTERFACE(signed long long)
CHRONICLE_DEFINE_INTEGER_INTERFACE(unsigned long long)

// FLOATS

void
to_dynamic(dynamic* v, double x)
{
    *v = x;
}

void
from_dynamic(double* x, dynamic const& v)
{
    // Integers are also acceptable as floats.
    if (v.type() == value_type::INTEGER)
        *x = boost::numeric_cast<double>(cast<integer>(v));
    else
        *x = cast<double>(v);
}

// PTIME

string
to_string(ptime const& t)
{
    namespace bt = boost::posix_time;
    std::ostringstream os;
    os.imbue(
        std::locale(std::cout.getloc(), new bt::time_facet("%Y-%m-%d %X")));
    os << t;
    return os.str();
}

string
to_value_string(ptime const& t)
{
    namespace bt = boost::posix_time;
    std::ostringstream os;
    os.imbue(
        std::locale(std::cout.getloc(), new bt::time_facet("%Y-%m-%dT%H:%M")));
    os << t;
    // Add the seconds and timezone manually to get millisecond precision.
    os << fmt::format(
        ":{:02d}.{:03d}Z",
        t.time_of_day().seconds(),
        t.time_of_day().total_milliseconds() % 1000);
    return os.str();
}

ptime
parse_ptime(string const& s)
{
    namespace bt = boost::posix_time;
    std::istringstream is(s);
    is.imbue(std::locale(
        std::cout.getloc(), new bt::time_input_facet("%Y-%m-%dT%H:%M:%s")));
    ptime t;
    is >> t;
    char z = '\0';
    is.get(z);
    if (t != ptime() && z == 'Z'
        && is.peek() == std::istringstream::traits_type::eof())
    {
        return t;
    }
    CHRONICLE_THROW(
        parsing_error() << expected_format_info("datetime")
                        << parsed_text_info(s));
}

ptime
get_current_time()
{
    namespace bt = boost::posix_time;
    auto now = bt::microsec_clock::universal_time();
    auto tod = now.time_of_day();
    return ptime(
        now.date(),
        bt::time_duration(tod.hours(), tod.minutes(), tod.seconds())
            + bt::milliseconds(tod.total_milliseconds() % 1000));
}

void
to_dynamic(dynamic* v, ptime const& x)
{
    *v = x;
}

void
from_dynamic(ptime* x, dynamic const& v)
{
    if (v.type() == value_type::STRING)
        *x = parse_ptime(cast<string>(v));
    else
        *x = cast<ptime>(v);
}

// OBJECT IDS

void
to_dynamic(dynamic* v, object_id const& x)
{
    *v = x;
}

void
from_dynamic(object_id* x, dynamic const& v)
{
    if (v.type() == value_type::STRING)
        *x = parse_object_id(cast<string>(v));
    else
        *x = cast<object_id>(v);
}

} // namespace chronicle
