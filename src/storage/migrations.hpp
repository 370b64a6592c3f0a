#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace rollplan::storage {

/**
 * Migration - One forward step of the schema.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "work_items_and_changelog",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS work_items (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                project_id TEXT NOT NULL,
                type TEXT NOT NULL
                    CHECK (type IN ('project', 'phase', 'task', 'subtask')),
                title TEXT NOT NULL CHECK (length(title) > 0),
                description TEXT,
                status TEXT NOT NULL DEFAULT 'not_started'
                    CHECK (status IN ('not_started', 'in_progress', 'completed')),
                parent_id INTEGER REFERENCES work_items(id),
                notes TEXT,
                order_index REAL NOT NULL DEFAULT 1.0,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_work_items_project ON work_items(project_id);
            CREATE INDEX IF NOT EXISTS idx_work_items_parent ON work_items(parent_id);
            CREATE INDEX IF NOT EXISTS idx_work_items_status ON work_items(status);

            CREATE TABLE IF NOT EXISTS changelog (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                work_item_id INTEGER NOT NULL,
                project_id TEXT NOT NULL,
                action TEXT NOT NULL
                    CHECK (action IN ('create', 'update', 'complete', 'field-change')),
                details TEXT NOT NULL DEFAULT '{}',
                created_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_changelog_project ON changelog(project_id);
            CREATE INDEX IF NOT EXISTS idx_changelog_item ON changelog(work_item_id);
        )SQL"
    }
};

/**
 * MigrationRunner - Brings a database up to the latest schema.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations in one transaction.
     */
    [[nodiscard]] Result<void, Error> migrate();

    /**
     * Get the current schema version (0 for a fresh database).
     */
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(const Migration& m);
};

/**
 * Initialize a database with all migrations. Safe to call on every open.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace rollplan::storage
