#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <variant>
#include <vector>

namespace rollplan {

enum class ItemType {
    Project,
    Phase,
    Task,
    Subtask
};

enum class ItemStatus {
    NotStarted,
    InProgress,
    Completed
};

[[nodiscard]] std::string_view to_string(ItemType type) noexcept;
[[nodiscard]] std::string_view to_string(ItemStatus status) noexcept;
[[nodiscard]] std::optional<ItemType> parse_item_type(std::string_view text);
[[nodiscard]] std::optional<ItemStatus> parse_item_status(std::string_view text);

/**
 * Plural noun used in completion summaries ("tasks", "subtasks", ...).
 */
[[nodiscard]] std::string_view plural_noun(ItemType type) noexcept;

/**
 * Position of a type in the hierarchy; project is 0, subtask is 3.
 */
[[nodiscard]] constexpr int type_rank(ItemType type) noexcept {
    return static_cast<int>(type);
}

/**
 * WorkItem - One node of a project's work hierarchy.
 *
 * project_id and type are fixed at creation. parent_id is absent only
 * for project-type roots.
 */
struct WorkItem {
    ItemId id{0};
    ProjectId project_id;
    ItemType type{ItemType::Task};
    std::string title;
    std::optional<std::string> description;
    ItemStatus status{ItemStatus::NotStarted};
    std::optional<ItemId> parent_id;
    std::optional<std::string> notes;
    double order_index{1.0};
    Timestamp created_at;
    Timestamp updated_at;

    [[nodiscard]] bool is_completed() const noexcept {
        return status == ItemStatus::Completed;
    }

    bool operator==(const WorkItem&) const = default;
};

/**
 * NewWorkItem - Caller-supplied fields for ItemStore::create.
 */
struct NewWorkItem {
    ProjectId project_id;
    ItemType type{ItemType::Task};
    std::string title;
    std::optional<std::string> description;
    std::optional<ItemId> parent_id;
    std::optional<std::string> notes;
};

// ============================================================================
// Updatable fields
//
// Only these fields can be named in an update. id, project_id and type
// have no alternative here, so an update cannot touch them.
// ============================================================================

namespace fields {

struct Title { std::string value; };
struct Description { std::optional<std::string> value; };
struct Status { ItemStatus value; };
struct Notes { std::optional<std::string> value; };
struct Parent { std::optional<ItemId> value; };
struct OrderIndex { double value; };

} // namespace fields

using FieldUpdate = std::variant<
    fields::Title,
    fields::Description,
    fields::Status,
    fields::Notes,
    fields::Parent,
    fields::OrderIndex
>;

/**
 * Column name of the field an update targets ("title", "parent_id", ...).
 */
[[nodiscard]] std::string_view field_name(const FieldUpdate& update) noexcept;

/**
 * Parse "name" + textual value into a FieldUpdate.
 *
 * An empty value clears optional fields (description, notes, parent_id).
 * Unknown names and the immutable id/project_id/type fail with
 * InvalidArgument.
 */
[[nodiscard]] Result<FieldUpdate> parse_field_update(std::string_view name, std::string_view value);

/**
 * Status transitions accepted by update(). Same-status is always allowed.
 */
[[nodiscard]] bool is_valid_transition(ItemStatus from, ItemStatus to) noexcept;

/**
 * Trim ASCII whitespace from both ends.
 */
[[nodiscard]] std::string trimmed(std::string_view text);

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline WorkItem with_status(WorkItem item, ItemStatus status, Timestamp now) {
    item.status = status;
    item.updated_at = now;
    return item;
}

/**
 * Apply one field update to an item. Does not touch updated_at.
 */
[[nodiscard]] WorkItem apply_update(WorkItem item, const FieldUpdate& update);

/**
 * Sibling order: ascending order_index, ties broken by id.
 */
[[nodiscard]] inline bool sibling_order_less(const WorkItem& a, const WorkItem& b) noexcept {
    if (a.order_index != b.order_index) {
        return a.order_index < b.order_index;
    }
    return a.id < b.id;
}

} // namespace rollplan
