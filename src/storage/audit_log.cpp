#include "storage/audit_log.hpp"

namespace rollplan::storage {

ChangelogEntry AuditLog::row_to_entry(Statement& stmt) {
    return ChangelogEntry{
        .id = stmt.column_int64(0),
        .work_item_id = stmt.column_int64(1),
        .project_id = stmt.column_text(2),
        .action = parse_change_action(stmt.column_text(3)).value_or(ChangeAction::Update),
        .details = stmt.column_text(4),
        .created_at = Timestamp(stmt.column_int64(5))
    };
}

Result<std::vector<ChangelogEntry>, Error> AuditLog::collect(Statement& stmt) {
    std::vector<ChangelogEntry> entries;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<ChangelogEntry>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        entries.push_back(row_to_entry(stmt));
    }
    return Result<std::vector<ChangelogEntry>, Error>::ok(std::move(entries));
}

Result<ChangelogEntry, Error> AuditLog::append(ChangelogEntry entry) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO changelog (work_item_id, project_id, action, details, created_at)
        VALUES (?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<ChangelogEntry, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int64(1, entry.work_item_id)
        .and_then([&] { return stmt.bind_text(2, entry.project_id); })
        .and_then([&] { return stmt.bind_text(3, to_string(entry.action)); })
        .and_then([&] { return stmt.bind_text(4, entry.details); })
        .and_then([&] { return stmt.bind_int64(5, entry.created_at.millis()); });
    if (bound.is_err()) {
        return Result<ChangelogEntry, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<ChangelogEntry, Error>::err(step_result.unwrap_err());
    }

    entry.id = db_.last_insert_rowid();
    return Result<ChangelogEntry, Error>::ok(std::move(entry));
}

Result<std::vector<ChangelogEntry>, Error> AuditLog::list_for_item(ItemId work_item_id) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, work_item_id, project_id, action, details, created_at
        FROM changelog
        WHERE work_item_id = ?
        ORDER BY created_at ASC, id ASC;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::vector<ChangelogEntry>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    if (auto bound = stmt.bind_int64(1, work_item_id); bound.is_err()) {
        return Result<std::vector<ChangelogEntry>, Error>::err(bound.unwrap_err());
    }

    return collect(stmt);
}

Result<std::vector<ChangelogEntry>, Error> AuditLog::list_for_project(
    const ProjectId& project_id,
    std::optional<size_t> limit
) {
    // The inner query picks the newest rows; the outer one restores
    // chronological order.
    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, work_item_id, project_id, action, details, created_at
        FROM (
            SELECT id, work_item_id, project_id, action, details, created_at
            FROM changelog
            WHERE project_id = ?
            ORDER BY created_at DESC, id DESC
            LIMIT ?
        )
        ORDER BY created_at ASC, id ASC;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::vector<ChangelogEntry>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    // LIMIT -1 means no limit in SQLite.
    const int64_t sql_limit = limit ? static_cast<int64_t>(*limit) : -1;
    auto bound = stmt.bind_text(1, project_id)
        .and_then([&] { return stmt.bind_int64(2, sql_limit); });
    if (bound.is_err()) {
        return Result<std::vector<ChangelogEntry>, Error>::err(bound.unwrap_err());
    }

    return collect(stmt);
}

} // namespace rollplan::storage
