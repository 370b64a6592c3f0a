#pragma once

#include "core/work_item.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rollplan {

/**
 * PlanNode - One entry of the rolling work plan.
 *
 * Expanded nodes carry the full item and every child. Collapsed nodes
 * stand in for a completed subtree with no open work: they keep only
 * id/title/type/status and a summary_text, and have no children.
 */
struct PlanNode {
    ItemId id{0};
    std::string title;
    ItemType type{ItemType::Task};
    ItemStatus status{ItemStatus::NotStarted};
    bool collapsed{false};

    std::optional<WorkItem> item;      // expanded only
    std::string summary_text;          // collapsed only
    std::string progress_text;         // expanded, when some children are done
    std::vector<PlanNode> children;    // expanded only

    bool operator==(const PlanNode&) const = default;
};

/**
 * WorkPlan - Rolling view of one project.
 *
 * roots holds every project-type root. unassigned holds subtrees whose
 * top item cannot be reached from a root (dangling parent, non-project
 * item without parent).
 */
struct WorkPlan {
    ProjectId project_id;
    std::vector<PlanNode> roots;
    std::vector<PlanNode> unassigned;
    size_t total_items{0};
    size_t open_items{0};

    bool operator==(const WorkPlan&) const = default;
};

/**
 * Derive the rolling work plan from the raw items of one project.
 *
 * Pure: the same items always yield the same plan, whatever their order.
 */
[[nodiscard]] WorkPlan build_rolling_plan(const ProjectId& project_id,
                                          const std::vector<WorkItem>& items);

/**
 * Summary line for a set of children, e.g. "2 of 3 tasks completed".
 * Returns "completed" when children is empty.
 */
[[nodiscard]] std::string completion_text(const std::vector<const WorkItem*>& children);

} // namespace rollplan
