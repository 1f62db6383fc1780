#include <chronicle/history/rollback.hpp>

#include <algorithm>

#include <chronicle/patch/apply.hpp>

namespace chronicle {

dynamic_map
replay_history(
    std::vector<change_record> const& history, object_id const& target)
{
    auto end = std::find_if(
        history.begin(), history.end(), [&](change_record const& r) {
            return r.id == target;
        });
    if (end == history.end())
    {
        CHRONICLE_THROW(unknown_patch() << patch_id_info(to_string(target)));
    }
    ++end;
    if (end == history.end())
    {
        CHRONICLE_THROW(noop_rollback() << patch_id_info(to_string(target)));
    }

    dynamic state = dynamic_map();
    for (auto i = history.begin(); i != end; ++i)
    {
        try
        {
            state = apply_patch(state, i->ops);
        }
        catch (boost::exception& e)
        {
            e << patch_id_info(to_string(i->id));
            throw;
        }
    }
    // A history could technically replace the root with something other
    // than a map, but a document has to be one.
    if (state.type() != value_type::MAP)
    {
        CHRONICLE_THROW(
            patch_apply_failure()
            << patch_id_info(to_string(target))
            << internal_error_message_info(
                   "replayed state is not a map"));
    }
    return cast<dynamic_map>(std::move(state));
}

dynamic_map
merge_overrides(dynamic_map const& base, dynamic_map const& overrides)
{
    dynamic_map merged = base;
    for (auto const& field : overrides)
    {
        auto existing = merged.find(field.first);
        if (existing == merged.end())
        {
            merged.insert(field);
        }
        else if (
            existing->second.type() == value_type::MAP
            && field.second.type() == value_type::MAP)
        {
            existing->second = merge_overrides(
                cast<dynamic_map>(existing->second),
                cast<dynamic_map>(field.second));
        }
        else
        {
            existing->second = field.second;
        }
    }
    return merged;
}

} // namespace chronicle
