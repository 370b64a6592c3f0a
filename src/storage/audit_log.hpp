#pragma once

#include "storage/database.hpp"
#include "core/changelog.hpp"
#include "core/result.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace rollplan::storage {

class ItemStore;

/**
 * AuditLog - Append-only changelog of accepted mutations.
 *
 * Entries are written only by ItemStore, inside the same transaction as
 * the mutation they describe. There is no update or delete.
 */
class AuditLog {
public:
    explicit AuditLog(Database& db) : db_(db) {}

    /**
     * All entries for one item, oldest first (created_at, then id).
     */
    [[nodiscard]] Result<std::vector<ChangelogEntry>, Error> list_for_item(ItemId work_item_id);

    /**
     * Entries for a project, oldest first. With a limit, only the most
     * recent `limit` entries are returned, still oldest first.
     */
    [[nodiscard]] Result<std::vector<ChangelogEntry>, Error> list_for_project(
        const ProjectId& project_id,
        std::optional<size_t> limit = std::nullopt);

private:
    friend class ItemStore;

    [[nodiscard]] Result<ChangelogEntry, Error> append(ChangelogEntry entry);

    [[nodiscard]] ChangelogEntry row_to_entry(Statement& stmt);
    [[nodiscard]] Result<std::vector<ChangelogEntry>, Error> collect(Statement& stmt);

    Database& db_;
};

} // namespace rollplan::storage
