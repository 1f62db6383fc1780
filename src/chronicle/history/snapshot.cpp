#include <chronicle/history/snapshot.hpp>

#include <chronicle/core/normalization.hpp>

namespace chronicle {

char const* const document_id_field = "_id";
char const* const version_key_field = "__v";
char const* const created_at_field = "createdAt";
char const* const updated_at_field = "updatedAt";

bool
is_bookkeeping_field(string const& name, bool timestamps)
{
    if (name == document_id_field || name == version_key_field)
        return true;
    return timestamps
           && (name == created_at_field || name == updated_at_field);
}

dynamic_map
take_snapshot(dynamic_map const& document, bool timestamps)
{
    dynamic_map data;
    for (auto const& field : document)
    {
        if (!is_bookkeeping_field(field.first, timestamps))
            data[field.first] = normalize_value(field.second);
    }
    return data;
}

} // namespace chronicle
