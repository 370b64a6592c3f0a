#include "storage/work_item_repository.hpp"

namespace rollplan::storage {

namespace {

constexpr const char* SELECT_COLUMNS = R"SQL(
    SELECT id, project_id, type, title, description, status, parent_id,
           notes, order_index, created_at, updated_at
    FROM work_items )SQL";

constexpr const char* SIBLING_ORDER = " ORDER BY order_index ASC, id ASC;";

std::string select_where(const std::string& where) {
    return std::string(SELECT_COLUMNS) + where;
}

} // namespace

WorkItem WorkItemRepository::row_to_item(Statement& stmt) {
    // The CHECK constraints on type/status make the fallbacks unreachable
    // for rows written through this repository.
    return WorkItem{
        .id = stmt.column_int64(0),
        .project_id = stmt.column_text(1),
        .type = parse_item_type(stmt.column_text(2)).value_or(ItemType::Task),
        .title = stmt.column_text(3),
        .description = stmt.column_optional_text(4),
        .status = parse_item_status(stmt.column_text(5)).value_or(ItemStatus::NotStarted),
        .parent_id = stmt.column_optional_int64(6),
        .notes = stmt.column_optional_text(7),
        .order_index = stmt.column_double(8),
        .created_at = Timestamp(stmt.column_int64(9)),
        .updated_at = Timestamp(stmt.column_int64(10))
    };
}

Result<std::vector<WorkItem>, Error> WorkItemRepository::collect(Statement& stmt) {
    std::vector<WorkItem> items;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<WorkItem>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        items.push_back(row_to_item(stmt));
    }
    return Result<std::vector<WorkItem>, Error>::ok(std::move(items));
}

Result<std::optional<WorkItem>, Error> WorkItemRepository::get(ItemId id) {
    auto stmt_result = db_.prepare(select_where("WHERE id = ?;"));
    if (stmt_result.is_err()) {
        return Result<std::optional<WorkItem>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    if (auto bound = stmt.bind_int64(1, id); bound.is_err()) {
        return Result<std::optional<WorkItem>, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<WorkItem>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<WorkItem>, Error>::ok(std::nullopt);
    }

    return Result<std::optional<WorkItem>, Error>::ok(row_to_item(stmt));
}

Result<std::optional<WorkItem>, Error> WorkItemRepository::get_in_project(
    ItemId id,
    const ProjectId& project_id
) {
    auto stmt_result = db_.prepare(select_where("WHERE id = ? AND project_id = ?;"));
    if (stmt_result.is_err()) {
        return Result<std::optional<WorkItem>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int64(1, id)
        .and_then([&] { return stmt.bind_text(2, project_id); });
    if (bound.is_err()) {
        return Result<std::optional<WorkItem>, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<WorkItem>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<WorkItem>, Error>::ok(std::nullopt);
    }

    return Result<std::optional<WorkItem>, Error>::ok(row_to_item(stmt));
}

Result<std::vector<WorkItem>, Error> WorkItemRepository::get_by_project(const ProjectId& project_id) {
    auto stmt_result = db_.prepare(select_where(std::string("WHERE project_id = ?") + SIBLING_ORDER));
    if (stmt_result.is_err()) {
        return Result<std::vector<WorkItem>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    if (auto bound = stmt.bind_text(1, project_id); bound.is_err()) {
        return Result<std::vector<WorkItem>, Error>::err(bound.unwrap_err());
    }

    return collect(stmt);
}

Result<std::vector<WorkItem>, Error> WorkItemRepository::get_by_status(
    const ProjectId& project_id,
    const std::vector<ItemStatus>& statuses
) {
    if (statuses.empty()) {
        return Result<std::vector<WorkItem>, Error>::ok({});
    }

    std::string placeholders;
    for (size_t i = 0; i < statuses.size(); ++i) {
        placeholders += (i == 0) ? "?" : ", ?";
    }

    auto stmt_result = db_.prepare(select_where(
        "WHERE project_id = ? AND status IN (" + placeholders + ")" + SIBLING_ORDER));
    if (stmt_result.is_err()) {
        return Result<std::vector<WorkItem>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    if (auto bound = stmt.bind_text(1, project_id); bound.is_err()) {
        return Result<std::vector<WorkItem>, Error>::err(bound.unwrap_err());
    }
    for (size_t i = 0; i < statuses.size(); ++i) {
        auto bound = stmt.bind_text(static_cast<int>(i) + 2, to_string(statuses[i]));
        if (bound.is_err()) {
            return Result<std::vector<WorkItem>, Error>::err(bound.unwrap_err());
        }
    }

    return collect(stmt);
}

Result<std::optional<double>, Error> WorkItemRepository::max_sibling_order(
    const ProjectId& project_id,
    const std::optional<ItemId>& parent_id
) {
    std::string sql = "SELECT MAX(order_index) FROM work_items WHERE project_id = ? AND ";
    sql += parent_id ? "parent_id = ?;" : "parent_id IS NULL;";

    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<std::optional<double>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, project_id);
    if (bound.is_ok() && parent_id) {
        bound = stmt.bind_int64(2, *parent_id);
    }
    if (bound.is_err()) {
        return Result<std::optional<double>, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<double>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap() || stmt.column_is_null(0)) {
        return Result<std::optional<double>, Error>::ok(std::nullopt);
    }

    return Result<std::optional<double>, Error>::ok(stmt.column_double(0));
}

Result<ItemId, Error> WorkItemRepository::insert(const WorkItem& item) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO work_items (project_id, type, title, description, status,
                                parent_id, notes, order_index, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<ItemId, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, item.project_id)
        .and_then([&] { return stmt.bind_text(2, to_string(item.type)); })
        .and_then([&] { return stmt.bind_text(3, item.title); })
        .and_then([&] { return stmt.bind_optional_text(4, item.description); })
        .and_then([&] { return stmt.bind_text(5, to_string(item.status)); })
        .and_then([&] { return stmt.bind_optional_int64(6, item.parent_id); })
        .and_then([&] { return stmt.bind_optional_text(7, item.notes); })
        .and_then([&] { return stmt.bind_double(8, item.order_index); })
        .and_then([&] { return stmt.bind_int64(9, item.created_at.millis()); })
        .and_then([&] { return stmt.bind_int64(10, item.updated_at.millis()); });
    if (bound.is_err()) {
        return Result<ItemId, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<ItemId, Error>::err(step_result.unwrap_err());
    }

    return Result<ItemId, Error>::ok(db_.last_insert_rowid());
}

Result<void, Error> WorkItemRepository::update(const WorkItem& item) {
    // project_id and type are not in the SET list; they never change.
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE work_items
        SET title = ?, description = ?, status = ?, parent_id = ?,
            notes = ?, order_index = ?, updated_at = ?
        WHERE id = ? AND project_id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, item.title)
        .and_then([&] { return stmt.bind_optional_text(2, item.description); })
        .and_then([&] { return stmt.bind_text(3, to_string(item.status)); })
        .and_then([&] { return stmt.bind_optional_int64(4, item.parent_id); })
        .and_then([&] { return stmt.bind_optional_text(5, item.notes); })
        .and_then([&] { return stmt.bind_double(6, item.order_index); })
        .and_then([&] { return stmt.bind_int64(7, item.updated_at.millis()); })
        .and_then([&] { return stmt.bind_int64(8, item.id); })
        .and_then([&] { return stmt.bind_text(9, item.project_id); });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    if (db_.changes() != 1) {
        return Result<void, Error>::err(Error{
            "Update of work item " + std::to_string(item.id) + " matched no row"});
    }

    return Result<void, Error>::ok();
}

} // namespace rollplan::storage
