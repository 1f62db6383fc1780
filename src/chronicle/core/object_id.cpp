#include <chronicle/core/object_id.hpp>

#include <atomic>
#include <cstring>
#include <ostream>
#include <random>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/functional/hash.hpp>

namespace chronicle {

namespace {

struct process_identity
{
    std::array<std::uint8_t, 5> random_bytes;
    std::atomic<std::uint32_t> counter;

    process_identity()
    {
        std::random_device device;
        std::mt19937 engine(device());
        std::uniform_int_distribution<unsigned> byte_dist(0, 0xff);
        for (auto& byte : random_bytes)
            byte = std::uint8_t(byte_dist(engine));
        std::uniform_int_distribution<std::uint32_t> counter_dist(
            0, 0x00ff'ffff);
        counter = counter_dist(engine);
    }
};

process_identity&
get_process_identity()
{
    static process_identity identity;
    return identity;
}

int
hex_digit_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

object_id
generate_object_id()
{
    return generate_object_id(
        boost::posix_time::microsec_clock::universal_time());
}

object_id
generate_object_id(boost::posix_time::ptime const& time)
{
    static boost::posix_time::ptime const epoch(
        boost::gregorian::date(1970, 1, 1));
    auto seconds = std::uint32_t((time - epoch).total_seconds());

    auto& identity = get_process_identity();
    auto count = identity.counter.fetch_add(1) & 0x00ff'ffff;

    object_id id;
    id.bytes[0] = std::uint8_t(seconds >> 24);
    id.bytes[1] = std::uint8_t(seconds >> 16);
    id.bytes[2] = std::uint8_t(seconds >> 8);
    id.bytes[3] = std::uint8_t(seconds);
    std::memcpy(&id.bytes[4], identity.random_bytes.data(), 5);
    id.bytes[9] = std::uint8_t(count >> 16);
    id.bytes[10] = std::uint8_t(count >> 8);
    id.bytes[11] = std::uint8_t(count);
    return id;
}

string
to_string(object_id const& id)
{
    static char const digits[] = "0123456789abcdef";
    string hex(24, '0');
    for (size_t i = 0; i != id.bytes.size(); ++i)
    {
        hex[i * 2] = digits[id.bytes[i] >> 4];
        hex[i * 2 + 1] = digits[id.bytes[i] & 0xf];
    }
    return hex;
}

bool
is_object_id_string(string const& s)
{
    if (s.length() != 24)
        return false;
    for (char c : s)
    {
        if (hex_digit_value(c) < 0)
            return false;
    }
    return true;
}

object_id
parse_object_id(string const& hex)
{
    if (!is_object_id_string(hex))
    {
        CHRONICLE_THROW(
            invalid_object_id() << expected_format_info("object_id")
                                << parsed_text_info(hex));
    }
    object_id id;
    for (size_t i = 0; i != id.bytes.size(); ++i)
    {
        id.bytes[i] = std::uint8_t(
            (hex_digit_value(hex[i * 2]) << 4)
            | hex_digit_value(hex[i * 2 + 1]));
    }
    return id;
}

bool
operator==(object_id const& a, object_id const& b)
{
    return a.bytes == b.bytes;
}
bool
operator!=(object_id const& a, object_id const& b)
{
    return !(a == b);
}
bool
operator<(object_id const& a, object_id const& b)
{
    return a.bytes < b.bytes;
}

std::ostream&
operator<<(std::ostream& s, object_id const& id)
{
    s << to_string(id);
    return s;
}

size_t
hash_value(object_id const& id)
{
    return boost::hash_range(id.bytes.begin(), id.bytes.end());
}

} // namespace chronicle
