#pragma once

#include "core/work_item.hpp"
#include "core/result.hpp"
#include <functional>
#include <optional>
#include <string_view>

namespace rollplan::hierarchy {

/**
 * Levels from a project root down to the deepest leaf, root included.
 */
inline constexpr int MAX_DEPTH = 4;

/**
 * Reason codes carried in Error::reason for InvalidHierarchy failures.
 */
enum class Violation {
    BadNesting,
    CrossProject,
    DepthExceeded,
    MissingParent
};

[[nodiscard]] std::string_view to_string(Violation violation) noexcept;

/**
 * Reason code of an InvalidHierarchy error, nullopt for any other error.
 */
[[nodiscard]] std::optional<Violation> violation_of(const Error& error);

/**
 * Nesting table: project -> {phase, task}, phase -> {task, subtask},
 * task -> {subtask}, subtask -> {}.
 */
[[nodiscard]] bool can_contain(ItemType parent, ItemType child) noexcept;

/**
 * Current stored state of an item, nullopt when no item has that id.
 * Lookups are not project-scoped; the validator checks scope itself.
 */
using ItemLookup = std::function<Result<std::optional<WorkItem>>(ItemId)>;

/**
 * Check that candidate may sit where its parent_id puts it.
 *
 * Order of checks: parent resolves, nesting table, same project, then
 * a walk up the parent chain that must reach a parentless project within
 * MAX_DEPTH items. When candidate.id is non-zero, the walk resolves that
 * id to candidate itself, so a move below one of its own descendants
 * never terminates inside the bound.
 */
[[nodiscard]] Result<void> validate_placement(const WorkItem& candidate, const ItemLookup& lookup);

} // namespace rollplan::hierarchy
