#ifndef CHRONICLE_CORE_OBJECT_ID_HPP
#define CHRONICLE_CORE_OBJECT_ID_HPP

#include <array>
#include <cstdint>
#include <iosfwd>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <chronicle/core/utilities.hpp>

namespace chronicle {

// An object_id is the opaque 12-byte identifier that the document stores
// assign to documents and change records.
//
// The layout follows the usual convention: a 4-byte big-endian timestamp
// (seconds since the epoch), 5 random bytes chosen once per process, and a
// 3-byte big-endian counter. Identifiers generated by the same process
// therefore sort in creation order.
//
// The canonical string form is 24 lowercase hex digits. Snapshots always use
// the string form so that an identifier never compares unequal to its own
// rendering.
struct object_id
{
    std::array<std::uint8_t, 12> bytes{};
};

// Generate a fresh identifier.
object_id
generate_object_id();

// Generate an identifier with a specific timestamp. (Mostly useful for
// tests that need identifiers with a known order.)
object_id
generate_object_id(boost::posix_time::ptime const& time);

// Get the 24-character hex form of an identifier.
string
to_string(object_id const& id);

// Parse the 24-character hex form of an identifier.
object_id
parse_object_id(string const& hex);

// Does :s look like the string form of an object_id?
bool
is_object_id_string(string const& s);

// If parse_object_id fails, it throws this exception.
CHRONICLE_DEFINE_EXCEPTION(invalid_object_id)
// (It also provides parsed_text_info.)

bool
operator==(object_id const& a, object_id const& b);
bool
operator!=(object_id const& a, object_id const& b);
bool
operator<(object_id const& a, object_id const& b);

std::ostream&
operator<<(std::ostream& s, object_id const& id);

size_t
hash_value(object_id const& id);

} // namespace chronicle

#endif
