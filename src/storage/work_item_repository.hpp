#pragma once

#include "storage/database.hpp"
#include "core/work_item.hpp"
#include "core/result.hpp"
#include <vector>
#include <optional>

namespace rollplan::storage {

/**
 * WorkItemRepository - Data access layer for the work_items table.
 *
 * Plain row I/O; hierarchy rules and the audit trail live in ItemStore.
 */
class WorkItemRepository {
public:
    explicit WorkItemRepository(Database& db) : db_(db) {}

    /**
     * Get an item by ID regardless of project.
     */
    [[nodiscard]] Result<std::optional<WorkItem>, Error> get(ItemId id);

    /**
     * Get an item by ID only if it belongs to project_id.
     */
    [[nodiscard]] Result<std::optional<WorkItem>, Error> get_in_project(
        ItemId id,
        const ProjectId& project_id);

    /**
     * Get all items of a project, in sibling order.
     */
    [[nodiscard]] Result<std::vector<WorkItem>, Error> get_by_project(const ProjectId& project_id);

    /**
     * Get the items of a project whose status is one of statuses.
     */
    [[nodiscard]] Result<std::vector<WorkItem>, Error> get_by_status(
        const ProjectId& project_id,
        const std::vector<ItemStatus>& statuses);

    /**
     * Largest order_index among the children of parent_id, nullopt if none.
     */
    [[nodiscard]] Result<std::optional<double>, Error> max_sibling_order(
        const ProjectId& project_id,
        const std::optional<ItemId>& parent_id);

    /**
     * Insert a new row; item.id is ignored and the new rowid returned.
     */
    [[nodiscard]] Result<ItemId, Error> insert(const WorkItem& item);

    /**
     * Write the mutable columns of an existing row.
     */
    [[nodiscard]] Result<void, Error> update(const WorkItem& item);

private:
    Database& db_;

    [[nodiscard]] WorkItem row_to_item(Statement& stmt);
    [[nodiscard]] Result<std::vector<WorkItem>, Error> collect(Statement& stmt);
};

} // namespace rollplan::storage
