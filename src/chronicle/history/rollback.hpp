#ifndef CHRONICLE_HISTORY_ROLLBACK_HPP
#define CHRONICLE_HISTORY_ROLLBACK_HPP

#include <chronicle/history/change_record.hpp>

namespace chronicle {

// ROLLBACK - A past state of a document is reconstructed by replaying a
// prefix of its history onto an empty map.

// This is thrown when the target of a rollback isn't in the history.
CHRONICLE_DEFINE_EXCEPTION(unknown_patch)
CHRONICLE_DEFINE_ERROR_INFO(string, patch_id)

// This is thrown when the target of a rollback is the latest record (so
// there's nothing to roll back).
CHRONICLE_DEFINE_EXCEPTION(noop_rollback)
// (This also provides patch_id_info.)

// Reconstruct the state of a document as of the record :target.
// :history must be in history order. The records up to and including
// :target are applied in order. If any of them fails to apply, the
// patch_apply_failure is annotated with the ID of that record.
dynamic_map
replay_history(
    std::vector<change_record> const& history, object_id const& target);

// Merge :overrides on top of :base. Overrides win, except that where both
// sides hold maps, the maps are merged recursively.
dynamic_map
merge_overrides(dynamic_map const& base, dynamic_map const& overrides);

} // namespace chronicle

#endif
