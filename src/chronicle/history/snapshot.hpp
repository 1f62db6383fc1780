#ifndef CHRONICLE_HISTORY_SNAPSHOT_HPP
#define CHRONICLE_HISTORY_SNAPSHOT_HPP

#include <chronicle/core/dynamic.hpp>

namespace chronicle {

// SNAPSHOTS - A snapshot is the normalized data view of a document, which is
// what change records describe.

// the names of the fields that the data view leaves out
extern char const* const document_id_field;
extern char const* const version_key_field;
extern char const* const created_at_field;
extern char const* const updated_at_field;

// Is :name one of the fields that the data view leaves out?
bool
is_bookkeeping_field(string const& name, bool timestamps);

// Get the data view of a stored document.
// This leaves out the document's ID and version key (and its timestamps, if
// :timestamps is set) and normalizes the rest.
dynamic_map
take_snapshot(dynamic_map const& document, bool timestamps);

} // namespace chronicle

#endif
