#include <chronicle/patch/original_values.hpp>

#include <chronicle/core/normalization.hpp>

namespace chronicle {

patch_operation_list
annotate_original_values(patch_operation_list const& ops, dynamic const& prior)
{
    auto normalized_prior = normalize_value(prior);
    patch_operation_list annotated;
    annotated.reserve(ops.size());
    for (auto const& op : ops)
    {
        patch_operation a = op;
        auto original = find_value_at_path(normalized_prior, op.path);
        if (original)
            a.original_value = *original;
        else
            a.original_value = none;
        annotated.push_back(std::move(a));
    }
    return annotated;
}

} // namespace chronicle
