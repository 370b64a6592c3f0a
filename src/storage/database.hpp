#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <memory>
#include <vector>
#include <optional>

namespace rollplan::storage {

/**
 * StoreOptions - How to open the backing SQLite file.
 */
struct StoreOptions {
    std::string path;
    // How long a writer waits for the SQLite write lock before failing.
    int busy_timeout_ms{2000};
};

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers
    [[nodiscard]] Result<void, Error> bind_text(int index, std::string_view text);
    [[nodiscard]] Result<void, Error> bind_int64(int index, int64_t value);
    [[nodiscard]] Result<void, Error> bind_double(int index, double value);
    [[nodiscard]] Result<void, Error> bind_null(int index);
    [[nodiscard]] Result<void, Error> bind_optional_text(int index, const std::optional<std::string>& text);
    [[nodiscard]] Result<void, Error> bind_optional_int64(int index, const std::optional<int64_t>& value);

    // Column getters
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] double column_double(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] std::optional<int64_t> column_optional_int64(int index) const;

    // Execute
    [[nodiscard]] Result<bool, Error> step();  // Returns true if there's a row

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection wrapper.
 *
 * One Database is one connection; share it by reference within a thread
 * and open one per thread. Write transactions are BEGIN IMMEDIATE so
 * concurrent connections serialize on the SQLite write lock, and a
 * connection that cannot get the lock within busy_timeout_ms fails with
 * a StorageFailure instead of waiting.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open a database connection.
     */
    [[nodiscard]] static Result<Database, Error> open(const StoreOptions& options);

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute one or more SQL statements without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Execute a function within a write transaction.
     * Commits when f() succeeds, rolls back when it fails.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                auto error = result.unwrap_err();
                error.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
                return ResultType::err(std::move(error));
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            auto error = commit_result.unwrap_err();
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                error.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
            }
            return ResultType::err(std::move(error));
        }

        return result;
    }

    [[nodiscard]] int64_t last_insert_rowid() const;

    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

} // namespace rollplan::storage
