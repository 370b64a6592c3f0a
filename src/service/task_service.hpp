#pragma once

#include "storage/database.hpp"
#include "storage/item_store.hpp"
#include "core/changelog.hpp"
#include "core/project_id.hpp"
#include "core/rolling_plan.hpp"
#include "core/search.hpp"
#include "core/work_item.hpp"
#include "core/result.hpp"
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace rollplan::service {

/**
 * TaskService - Operation surface over one open database.
 *
 * Holds no state of its own beyond the store; construct one per
 * connection.
 */
class TaskService {
public:
    explicit TaskService(storage::Database& db) : store_(db) {}

    [[nodiscard]] Result<ProjectIdentity> identify(std::string_view descriptor) const;

    [[nodiscard]] Result<WorkPlan> get_current_work_plan(const ProjectId& project_id);

    [[nodiscard]] Result<WorkItem> create_work_item(const NewWorkItem& fields);

    [[nodiscard]] Result<WorkItem> update_work_item(ItemId id,
                                                    const ProjectId& project_id,
                                                    const std::vector<FieldUpdate>& updates);

    [[nodiscard]] Result<WorkItem> complete_item(ItemId id, const ProjectId& project_id);

    [[nodiscard]] Result<std::vector<SearchHit>> search_items(std::string_view query,
                                                              const ProjectId& project_id);

    [[nodiscard]] Result<std::vector<ChangelogEntry>> get_changelog(
        const ProjectId& project_id,
        std::optional<size_t> limit = std::nullopt);

    /**
     * Changelog of one item; NotFound unless the item is in project_id.
     */
    [[nodiscard]] Result<std::vector<ChangelogEntry>> get_item_history(ItemId id,
                                                                       const ProjectId& project_id);

private:
    storage::ItemStore store_;
};

} // namespace rollplan::service
