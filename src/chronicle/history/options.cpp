#include <chronicle/history/options.hpp>

namespace chronicle {

bool
operator==(include_field_spec const& a, include_field_spec const& b)
{
    return a.from == b.from;
}

bool
operator!=(include_field_spec const& a, include_field_spec const& b)
{
    return !(a == b);
}

void
to_dynamic(dynamic* v, include_field_spec const& x)
{
    dynamic_map map;
    if (x.from)
        write_field_to_record(map, "from", *x.from);
    *v = std::move(map);
}

void
from_dynamic(include_field_spec* x, dynamic const& v)
{
    auto const& map = cast<dynamic_map>(v);
    x->from = none;
    read_optional_field_from_record(&x->from, map, "from");
}

bool
operator==(history_options const& a, history_options const& b)
{
    return a.name == b.name && a.collection == b.collection
           && a.history_collection == b.history_collection
           && a.excludes == b.excludes && a.includes == b.includes
           && a.purge_on_delete == b.purge_on_delete
           && a.track_original_value == b.track_original_value
           && a.timestamps == b.timestamps;
}

bool
operator!=(history_options const& a, history_options const& b)
{
    return !(a == b);
}

string
get_history_collection(history_options const& options)
{
    return options.history_collection.empty()
               ? options.name + "_history"
               : options.history_collection;
}

static dynamic
includes_to_dynamic(std::map<string, include_field_spec> const& includes)
{
    dynamic_map map;
    for (auto const& include : includes)
        map[include.first] = to_dynamic(include.second);
    return map;
}

static std::map<string, include_field_spec>
includes_from_dynamic(dynamic const& v)
{
    std::map<string, include_field_spec> includes;
    for (auto const& field : cast<dynamic_map>(v))
    {
        try
        {
            includes[field.first]
                = from_dynamic<include_field_spec>(field.second);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, field.first);
            throw;
        }
    }
    return includes;
}

void
to_dynamic(dynamic* v, history_options const& x)
{
    dynamic_map map;
    write_field_to_record(map, "name", x.name);
    write_field_to_record(map, "collection", x.collection);
    write_field_to_record(
        map, "history_collection", get_history_collection(x));
    write_field_to_record(map, "excludes", x.excludes);
    map["includes"] = includes_to_dynamic(x.includes);
    write_field_to_record(map, "purge_on_delete", x.purge_on_delete);
    write_field_to_record(
        map, "track_original_value", x.track_original_value);
    write_field_to_record(map, "timestamps", x.timestamps);
    *v = std::move(map);
}

void
from_dynamic(history_options* x, dynamic const& v)
{
    auto const& map = cast<dynamic_map>(v);
    *x = history_options();
    read_field_from_record(&x->name, map, "name");
    read_field_from_record(&x->collection, map, "collection");
    read_optional_field_from_record(
        &x->history_collection, map, "history_collection");
    read_optional_field_from_record(&x->excludes, map, "excludes");
    dynamic const* includes;
    if (get_field(&includes, map, "includes"))
    {
        try
        {
            x->includes = includes_from_dynamic(*includes);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, "includes");
            throw;
        }
    }
    read_optional_field_from_record(
        &x->purge_on_delete, map, "purge_on_delete");
    read_optional_field_from_record(
        &x->track_original_value, map, "track_original_value");
    read_optional_field_from_record(&x->timestamps, map, "timestamps");
}

void
to_dynamic(dynamic* v, tool_config const& x)
{
    dynamic_map map;
    write_field_to_record(map, "database", x.database);
    write_field_to_record(map, "types", x.types);
    *v = std::move(map);
}

void
from_dynamic(tool_config* x, dynamic const& v)
{
    auto const& map = cast<dynamic_map>(v);
    *x = tool_config();
    read_field_from_record(&x->database, map, "database");
    read_optional_field_from_record(&x->types, map, "types");
}

history_options const&
find_type_options(tool_config const& config, string const& name)
{
    for (auto const& type : config.types)
    {
        if (type.name == name)
            return type;
    }
    CHRONICLE_THROW(unregistered_type() << type_name_info(name));
}

} // namespace chronicle
