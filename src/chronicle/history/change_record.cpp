#include <chronicle/history/change_record.hpp>

#include <algorithm>
#include <ostream>

#include <chronicle/patch/diff.hpp>
#include <chronicle/patch/exclusion.hpp>
#include <chronicle/patch/original_values.hpp>

namespace chronicle {

bool
operator==(change_record const& a, change_record const& b)
{
    return a.id == b.id && a.date == b.date && a.ref == b.ref
           && a.ops == b.ops && a.extra == b.extra;
}

bool
operator!=(change_record const& a, change_record const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, change_record const& record)
{
    s << to_dynamic(record);
    return s;
}

void
to_dynamic(dynamic* v, change_record const& x)
{
    dynamic_map map;
    write_field_to_record(map, "_id", x.id);
    write_field_to_record(map, "date", x.date);
    write_field_to_record(map, "ref", x.ref);
    write_field_to_record(map, "ops", x.ops);
    for (auto const& field : x.extra)
        map.insert(field);
    *v = std::move(map);
}

static bool
is_record_field(string const& name)
{
    return name == "_id" || name == "date" || name == "ref" || name == "ops";
}

void
from_dynamic(change_record* x, dynamic const& v)
{
    auto const& map = cast<dynamic_map>(v);
    read_field_from_record(&x->id, map, "_id");
    read_field_from_record(&x->date, map, "date");
    read_field_from_record(&x->ref, map, "ref");
    read_field_from_record(&x->ops, map, "ops");
    x->extra.clear();
    for (auto const& field : map)
    {
        if (!is_record_field(field.first))
            x->extra.insert(field);
    }
}

bool
record_precedes(change_record const& a, change_record const& b)
{
    if (a.date != b.date)
        return a.date < b.date;
    return a.id < b.id;
}

void
sort_history(std::vector<change_record>& history)
{
    std::stable_sort(history.begin(), history.end(), record_precedes);
}

optional<patch_operation_list>
compute_change_ops(
    dynamic const& prior,
    dynamic const& current,
    std::vector<path_pattern> const& excludes,
    bool annotate_original)
{
    auto ops = compute_patch(prior, current);
    if (!excludes.empty())
        ops = filter_operations(ops, excludes);
    if (ops.empty())
        return none;
    if (annotate_original)
        ops = annotate_original_values(ops, prior);
    return ops;
}

optional<change_record>
compute_change_record(
    object_id const& ref,
    dynamic const& prior,
    dynamic const& current,
    std::vector<path_pattern> const& excludes,
    bool annotate_original,
    ptime const& date)
{
    auto ops = compute_change_ops(prior, current, excludes, annotate_original);
    if (!ops)
        return none;
    change_record record;
    record.id = generate_object_id();
    record.date = date;
    record.ref = ref;
    record.ops = std::move(*ops);
    return record;
}

} // namespace chronicle
