#include <chronicle/store/query.hpp>

#include <algorithm>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>

#include <chronicle/core/normalization.hpp>

namespace chronicle {

object_id
get_document_id(dynamic_map const& document)
{
    return from_dynamic<object_id>(get_field(document, "_id"));
}

static std::vector<string>
split_dotted_path(string const& path)
{
    std::vector<string> segments;
    boost::algorithm::split(
        segments, path, [](char c) { return c == '.'; });
    return segments;
}

static bool
is_operator(string const& name)
{
    return !name.empty() && name[0] == '$';
}

// Is :v a map of query operators (e.g., {"$in": [...]})?
static bool
is_operator_map(dynamic const& v)
{
    if (v.type() != value_type::MAP)
        return false;
    auto const& map = cast<dynamic_map>(v);
    return !map.empty()
           && std::all_of(map.begin(), map.end(), [](auto const& field) {
                  return is_operator(field.first);
              });
}

dynamic const*
find_dotted_field(dynamic_map const& document, string const& path)
{
    dynamic const* current = nullptr;
    dynamic_map const* map = &document;
    for (auto const& segment : split_dotted_path(path))
    {
        if (map)
        {
            auto field = map->find(segment);
            if (field == map->end())
                return nullptr;
            current = &field->second;
        }
        else if (current && current->type() == value_type::ARRAY)
        {
            auto const& array = cast<dynamic_array>(*current);
            size_t index;
            if (!boost::conversion::try_lexical_convert(segment, index)
                || index >= array.size())
            {
                return nullptr;
            }
            current = &array[index];
        }
        else
        {
            return nullptr;
        }
        map = current->type() == value_type::MAP ? &cast<dynamic_map>(*current)
                                                 : nullptr;
    }
    return current;
}

static bool
value_matches(dynamic const* found, dynamic const& expected)
{
    if (!found)
        return expected.type() == value_type::NIL;
    if (equivalent(*found, expected))
        return true;
    if (found->type() == value_type::ARRAY)
    {
        auto const& array = cast<dynamic_array>(*found);
        return std::any_of(array.begin(), array.end(), [&](dynamic const& v) {
            return equivalent(v, expected);
        });
    }
    return false;
}

static bool
operator_matches(
    dynamic const* found, string const& op, dynamic const& argument)
{
    if (op == "$eq")
        return value_matches(found, argument);
    if (op == "$ne")
        return !value_matches(found, argument);
    if (op == "$in")
    {
        if (argument.type() != value_type::ARRAY)
        {
            CHRONICLE_THROW(
                invalid_query()
                << query_operator_info(op)
                << internal_error_message_info("$in requires an array"));
        }
        auto const& candidates = cast<dynamic_array>(argument);
        return std::any_of(
            candidates.begin(), candidates.end(), [&](dynamic const& v) {
                return value_matches(found, v);
            });
    }
    if (op == "$exists")
    {
        bool exists = found && found->type() != value_type::NIL;
        return exists == from_dynamic<bool>(argument);
    }
    CHRONICLE_THROW(invalid_query() << query_operator_info(op));
}

bool
matches_query(dynamic_map const& document, document_query const& query)
{
    for (auto const& condition : query)
    {
        if (is_operator(condition.first))
        {
            CHRONICLE_THROW(
                invalid_query() << query_operator_info(condition.first));
        }
        auto found = find_dotted_field(document, condition.first);
        if (is_operator_map(condition.second))
        {
            for (auto const& op : cast<dynamic_map>(condition.second))
            {
                if (!operator_matches(found, op.first, op.second))
                    return false;
            }
        }
        else if (!value_matches(found, condition.second))
        {
            return false;
        }
    }
    return true;
}

// UPDATES

// Get the field at a dotted path within :document, creating it (and any
// intermediate maps) if necessary.
static dynamic&
get_or_create_dotted_field(dynamic_map& document, string const& path)
{
    auto segments = split_dotted_path(path);
    dynamic_map* map = &document;
    for (size_t i = 0; i + 1 < segments.size(); ++i)
    {
        dynamic& next = (*map)[segments[i]];
        if (next.type() != value_type::MAP)
        {
            if (next.type() != value_type::NIL)
            {
                CHRONICLE_THROW(
                    invalid_update() << internal_error_message_info(
                        "can't create field " + path
                        + " inside a non-map value"));
            }
            next = dynamic_map();
        }
        map = &cast<dynamic_map>(next);
    }
    return (*map)[segments.back()];
}

static void
erase_dotted_field(dynamic_map& document, string const& path)
{
    auto segments = split_dotted_path(path);
    dynamic_map* map = &document;
    for (size_t i = 0; i + 1 < segments.size(); ++i)
    {
        auto next = map->find(segments[i]);
        if (next == map->end() || next->second.type() != value_type::MAP)
            return;
        map = &cast<dynamic_map>(next->second);
    }
    map->erase(segments.back());
}

static dynamic_map const&
get_operator_fields(string const& op, dynamic const& argument)
{
    if (argument.type() != value_type::MAP)
    {
        CHRONICLE_THROW(
            invalid_update()
            << query_operator_info(op)
            << internal_error_message_info("operator requires a map"));
    }
    return cast<dynamic_map>(argument);
}

static void
increment_field(dynamic& field, dynamic const& amount, string const& path)
{
    if (field.type() == value_type::NIL)
    {
        field = amount;
        return;
    }
    if (field.type() == value_type::INTEGER
        && amount.type() == value_type::INTEGER)
    {
        field = cast<integer>(field) + cast<integer>(amount);
        return;
    }
    auto as_double = [&](dynamic const& v) {
        switch (v.type())
        {
            case value_type::INTEGER:
                return double(cast<integer>(v));
            case value_type::FLOAT:
                return cast<double>(v);
            default:
                CHRONICLE_THROW(
                    invalid_update()
                    << query_operator_info("$inc")
                    << internal_error_message_info(
                           "can't increment non-numeric field " + path));
        }
    };
    field = as_double(field) + as_double(amount);
}

static void
apply_update_operator(
    dynamic_map& document,
    string const& op,
    dynamic const& argument,
    bool inserting)
{
    if (op == "$set" || op == "$setOnInsert")
    {
        if (op == "$setOnInsert" && !inserting)
            return;
        for (auto const& field : get_operator_fields(op, argument))
            get_or_create_dotted_field(document, field.first) = field.second;
    }
    else if (op == "$unset")
    {
        for (auto const& field : get_operator_fields(op, argument))
            erase_dotted_field(document, field.first);
    }
    else if (op == "$inc")
    {
        for (auto const& field : get_operator_fields(op, argument))
        {
            increment_field(
                get_or_create_dotted_field(document, field.first),
                field.second,
                field.first);
        }
    }
    else if (op == "$push" || op == "$pull")
    {
        for (auto const& field : get_operator_fields(op, argument))
        {
            auto& target = get_or_create_dotted_field(document, field.first);
            if (target.type() == value_type::NIL)
                target = dynamic_array();
            if (target.type() != value_type::ARRAY)
            {
                CHRONICLE_THROW(
                    invalid_update()
                    << query_operator_info(op)
                    << internal_error_message_info(
                           field.first + " is not an array"));
            }
            auto& array = cast<dynamic_array>(target);
            if (op == "$push")
            {
                array.push_back(field.second);
            }
            else
            {
                array.erase(
                    std::remove_if(
                        array.begin(),
                        array.end(),
                        [&](dynamic const& item) {
                            return equivalent(item, field.second);
                        }),
                    array.end());
            }
        }
    }
    else
    {
        CHRONICLE_THROW(invalid_update() << query_operator_info(op));
    }
}

dynamic_map
apply_update(
    dynamic_map const& document,
    update_expression const& update,
    bool inserting)
{
    dynamic_map updated = document;
    for (auto const& field : update)
    {
        if (is_operator(field.first))
        {
            apply_update_operator(
                updated, field.first, field.second, inserting);
        }
        else
        {
            // Direct assignments behave like $set.
            get_or_create_dotted_field(updated, field.first) = field.second;
        }
    }
    return updated;
}

dynamic_map
make_upsert_document(
    document_query const& query, update_expression const& update)
{
    dynamic_map document;
    for (auto const& condition : query)
    {
        if (is_operator(condition.first))
            continue;
        if (is_operator_map(condition.second))
        {
            auto const& ops = cast<dynamic_map>(condition.second);
            auto eq = ops.find("$eq");
            if (eq != ops.end())
            {
                get_or_create_dotted_field(document, condition.first)
                    = eq->second;
            }
        }
        else
        {
            get_or_create_dotted_field(document, condition.first)
                = condition.second;
        }
    }
    document = apply_update(document, update, true);
    if (document.find("_id") == document.end())
    {
        dynamic_map with_id;
        with_id["_id"] = generate_object_id();
        for (auto& field : document)
            with_id.insert(std::move(field));
        document = std::move(with_id);
    }
    return document;
}

document_query
merge_conditions_with_update(
    document_query const& conditions, update_expression const& update)
{
    auto set = update.find("$set");
    dynamic_map const& assignments
        = set != update.end() && set->second.type() == value_type::MAP
              ? cast<dynamic_map>(set->second)
              : update;

    document_query merged = conditions;
    for (auto const& field : assignments)
        merged[field.first] = field.second;

    document_query result;
    for (auto const& field : merged)
    {
        if (!boost::algorithm::contains(field.first, "$"))
            result.insert(field);
    }
    return result;
}

document_query
make_id_query(object_id const& id)
{
    return document_query{{"_id", id}};
}

document_query
make_id_query(std::vector<object_id> const& ids)
{
    dynamic_array id_list;
    for (auto const& id : ids)
        id_list.push_back(id);
    return document_query{{"_id", dynamic_map{{"$in", id_list}}}};
}

} // namespace chronicle
