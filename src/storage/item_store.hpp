#pragma once

#include "storage/database.hpp"
#include "storage/work_item_repository.hpp"
#include "storage/audit_log.hpp"
#include "core/search.hpp"
#include "core/work_item.hpp"
#include "core/result.hpp"
#include <vector>

namespace rollplan::storage {

/**
 * ItemStore - Single source of truth for work items.
 *
 * Every mutation runs in one write transaction together with the
 * changelog entries it produces, and passes the hierarchy validator
 * before anything is written. All lookups are scoped to a project.
 */
class ItemStore {
public:
    explicit ItemStore(Database& db);

    [[nodiscard]] Result<WorkItem, Error> create(const NewWorkItem& fields);

    /**
     * Apply field updates to an item. Writes one field-change entry per
     * field whose value changed; an update that changes nothing returns
     * the stored item and writes nothing.
     */
    [[nodiscard]] Result<WorkItem, Error> update(ItemId id,
                                                 const ProjectId& project_id,
                                                 const std::vector<FieldUpdate>& updates);

    /**
     * Mark an item completed and record a complete entry.
     * Completing an already completed item is a no-op.
     */
    [[nodiscard]] Result<WorkItem, Error> complete(ItemId id, const ProjectId& project_id);

    [[nodiscard]] Result<WorkItem, Error> get(ItemId id, const ProjectId& project_id);

    [[nodiscard]] Result<std::vector<WorkItem>, Error> list_by_project(const ProjectId& project_id);

    [[nodiscard]] Result<std::vector<WorkItem>, Error> list_by_project(
        const ProjectId& project_id,
        const std::vector<ItemStatus>& statuses);

    [[nodiscard]] Result<std::vector<SearchHit>, Error> search(const ProjectId& project_id,
                                                               std::string_view query);

    [[nodiscard]] AuditLog& audit_log() { return log_; }

private:
    [[nodiscard]] Result<WorkItem, Error> create_in_transaction(const NewWorkItem& fields);
    [[nodiscard]] Result<WorkItem, Error> update_in_transaction(
        ItemId id,
        const ProjectId& project_id,
        const std::vector<FieldUpdate>& updates);
    [[nodiscard]] Result<WorkItem, Error> complete_in_transaction(ItemId id,
                                                                  const ProjectId& project_id);

    Database& db_;
    WorkItemRepository items_;
    AuditLog log_;
};

/**
 * Reject empty or repeated field lists and out-of-range values before
 * any row is read.
 */
[[nodiscard]] Result<void, Error> check_field_updates(const std::vector<FieldUpdate>& updates);

} // namespace rollplan::storage
