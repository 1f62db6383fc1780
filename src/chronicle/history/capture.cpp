#include <chronicle/history/capture.hpp>

#include <ostream>

#include <chronicle/store/query.hpp>

namespace chronicle {

bool
operator==(captured_document const& a, captured_document const& b)
{
    return a.id == b.id && a.snapshot == b.snapshot;
}

bool
operator!=(captured_document const& a, captured_document const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, captured_document const& c)
{
    s << c.id << ": " << c.snapshot;
    return s;
}

resolution_strategy
choose_resolution_strategy(single_capture_context const& context)
{
    if (context.prior)
        return by_identity_set{{context.prior->id}};
    return by_merged_conditions{
        merge_conditions_with_update(context.query, context.update)};
}

resolution_strategy
choose_resolution_strategy(batch_capture_context const& context)
{
    if (!context.priors.empty())
    {
        return by_identity_set{map(
            [](captured_document const& c) { return c.id; },
            context.priors)};
    }
    return by_merged_conditions{
        merge_conditions_with_update(context.query, context.update)};
}

namespace {

struct query_builder
{
    document_query
    operator()(by_identity_set const& s) const
    {
        if (s.ids.size() == 1)
            return make_id_query(s.ids.front());
        return make_id_query(s.ids);
    }

    document_query
    operator()(by_merged_conditions const& s) const
    {
        return s.conditions;
    }
};

} // namespace

document_query
to_query(resolution_strategy const& strategy)
{
    return std::visit(query_builder(), strategy);
}

bool
update_touched_nothing(update_result const& result)
{
    return result.counts_reported && result.matched_count == 0
           && result.upserted_count == 0;
}

std::vector<capture_pairing>
pair_by_identity(
    std::vector<captured_document> const& priors,
    std::vector<dynamic_map> const& resolved)
{
    std::vector<capture_pairing> pairings;
    pairings.reserve(resolved.size());
    for (auto const& document : resolved)
    {
        capture_pairing pairing;
        pairing.id = get_document_id(document);
        pairing.document = document;
        for (auto const& prior : priors)
        {
            if (prior.id == pairing.id)
            {
                pairing.prior = prior.snapshot;
                break;
            }
        }
        pairings.push_back(std::move(pairing));
    }
    return pairings;
}

} // namespace chronicle
