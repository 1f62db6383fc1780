#ifndef CHRONICLE_CORE_TYPE_DEFINITIONS_HPP
#define CHRONICLE_CORE_TYPE_DEFINITIONS_HPP

#include <any>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <chronicle/core/object_id.hpp>
#include <chronicle/core/utilities.hpp>

namespace chronicle {

typedef int64_t integer;

using boost::posix_time::ptime;

// nil_t is a unit type. It has only one possible value, :nil.
struct nil_t
{
};
static nil_t nil;

struct dynamic;
struct dynamic_map;

enum class value_type
{
    NIL, // nil_t - no value
    BOOLEAN, // bool
    INTEGER, // integer
    FLOAT, // double
    STRING, // string
    DATETIME, // boost::posix_time::ptime
    OBJECT_ID, // object_id - opaque store identifier
    ARRAY, // dynamic_array - array of dynamic values
    MAP, // dynamic_map - collection of named dynamic values
};

// Arrays are represented as std::vectors and can be manipulated as such.
typedef std::vector<dynamic> dynamic_array;

struct dynamic
{
    // CONSTRUCTORS

    // Default construction creates a nil value.
    dynamic()
    {
        set(nil);
    }

    // Construct a dynamic from one of the base types.
    dynamic(nil_t v)
    {
        set(v);
    }
    dynamic(bool v)
    {
        set(v);
    }
    dynamic(integer v)
    {
        set(v);
    }
    dynamic(double v)
    {
        set(v);
    }
    dynamic(string const& v)
    {
        set(v);
    }
    dynamic(string&& v)
    {
        set(std::move(v));
    }
    dynamic(char const* v)
    {
        set(string(v));
    }
    dynamic(ptime const& v)
    {
        set(v);
    }
    dynamic(object_id const& v)
    {
        set(v);
    }
    dynamic(dynamic_array const& v)
    {
        set(v);
    }
    dynamic(dynamic_array&& v)
    {
        set(std::move(v));
    }
    dynamic(dynamic_map const& v);
    dynamic(dynamic_map&& v);

    // Construct from an initializer list.
    dynamic(std::initializer_list<dynamic> list);

    // GETTERS

    // Get the type of value stored here.
    value_type
    type() const
    {
        return type_;
    }

    // Get the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any const&
    contents() const&
    {
        return value_;
    }

    // Get a non-const reference to the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any&
    contents() &
    {
        return value_;
    }

    // Get an r-value reference to the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any&&
    contents() &&
    {
        return std::move(value_);
    }

 private:
    void
    set(nil_t _);
    void
    set(bool v);
    void
    set(integer v);
    void
    set(double v);
    void
    set(string const& v);
    void
    set(string&& v);
    void
    set(ptime const& v);
    void
    set(object_id const& v);
    void
    set(dynamic_array const& v);
    void
    set(dynamic_array&& v);
    void
    set(dynamic_map const& v);
    void
    set(dynamic_map&& v);

    friend void
    swap(dynamic& a, dynamic& b);

    value_type type_;
    std::any value_;
};

// Maps are keyed by strings and remember the order in which their fields were
// inserted. That order is what diffs and JSON output follow, but it's
// irrelevant for comparison: two maps are equal if they hold the same fields
// with equal values.
//
// Documents are small, so lookups are simple linear scans.
struct dynamic_map
{
    typedef std::pair<string, dynamic> value_type;
    typedef std::vector<value_type> storage_type;
    typedef storage_type::iterator iterator;
    typedef storage_type::const_iterator const_iterator;

    dynamic_map()
    {
    }
    dynamic_map(std::initializer_list<value_type> fields);

    iterator
    begin()
    {
        return fields_.begin();
    }
    iterator
    end()
    {
        return fields_.end();
    }
    const_iterator
    begin() const
    {
        return fields_.begin();
    }
    const_iterator
    end() const
    {
        return fields_.end();
    }

    size_t
    size() const
    {
        return fields_.size();
    }
    bool
    empty() const
    {
        return fields_.empty();
    }

    iterator
    find(string const& key);
    const_iterator
    find(string const& key) const;

    size_t
    count(string const& key) const
    {
        return find(key) != end() ? 1 : 0;
    }

    // Get the field with the given key, appending a nil field if there isn't
    // one yet.
    dynamic&
    operator[](string const& key);

    // Insert a field at the end of the map. If the key is already present,
    // the map is left unchanged and the existing field is returned.
    std::pair<iterator, bool>
    insert(value_type field);

    // Remove the field with the given key (if any).
    // Returns the number of fields removed.
    size_t
    erase(string const& key);

    iterator
    erase(const_iterator position);

    void
    clear()
    {
        fields_.clear();
    }

 private:
    storage_type fields_;
};

} // namespace chronicle

#endif
