#ifndef CHRONICLE_HISTORY_OPTIONS_HPP
#define CHRONICLE_HISTORY_OPTIONS_HPP

#include <map>
#include <vector>

#include <chronicle/core/type_interfaces.hpp>

namespace chronicle {

// HISTORY OPTIONS - These describe how history is tracked for one type of
// document. They're normally read from the "types" section of a
// configuration file (JSON or YAML).

// An extra field to copy into every change record.
struct include_field_spec
{
    // the name of the field (on the document or in the caller-supplied extra
    // values) that provides the value - If omitted, the field's own name is
    // used.
    optional<string> from;
};

bool
operator==(include_field_spec const& a, include_field_spec const& b);
bool
operator!=(include_field_spec const& a, include_field_spec const& b);

void
to_dynamic(dynamic* v, include_field_spec const& x);

void
from_dynamic(include_field_spec* x, dynamic const& v);

struct history_options
{
    // the name of the document type
    string name;

    // the collection that holds the documents
    string collection;

    // the collection that holds the change records
    // (If this is empty, "<name>_history" is used.)
    string history_collection;

    // paths (or path patterns) that are never recorded
    std::vector<string> excludes;

    // extra change record fields, by name
    std::map<string, include_field_spec> includes;

    // Should a document's history be deleted along with the document?
    bool purge_on_delete = true;

    // Should operations carry the value that they replaced?
    bool track_original_value = false;

    // Does the tracker maintain createdAt/updatedAt fields on documents?
    bool timestamps = false;
};

bool
operator==(history_options const& a, history_options const& b);
bool
operator!=(history_options const& a, history_options const& b);

// Get the name of the collection that holds the change records for a type.
string
get_history_collection(history_options const& options);

// Only "name" and "collection" are required. Everything else defaults as
// described above.
void
to_dynamic(dynamic* v, history_options const& x);

void
from_dynamic(history_options* x, dynamic const& v);

// the configuration of the command-line tool
struct tool_config
{
    // the path to the SQLite database file
    string database;

    // the tracked document types
    std::vector<history_options> types;
};

void
to_dynamic(dynamic* v, tool_config const& x);

void
from_dynamic(tool_config* x, dynamic const& v);

// Find the options for a type within a tool configuration.
// If there's no such type, this throws an unregistered_type exception.
history_options const&
find_type_options(tool_config const& config, string const& name);

CHRONICLE_DEFINE_EXCEPTION(unregistered_type)
CHRONICLE_DEFINE_ERROR_INFO(string, type_name)

} // namespace chronicle

#endif
