#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <cstddef>
#include <string>
#include <memory>
#include <functional>
#include <variant>
#include <vector>
#include <optional>

namespace blockstore::storage {

/**
 * A value bound to a `?` placeholder.
 */
using SqlValue = std::variant<std::nullptr_t, int64_t, double, std::string>;

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
    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int(int index, int value);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_double(int index, double value);
    Result<void, Error> bind_null(int index);
    Result<void, Error> bind_uuid(int index, const Uuid& id);
    Result<void, Error> bind_optional_uuid(int index, const std::optional<Uuid>& id);
    Result<void, Error> bind_value(int index, const SqlValue& value);

    /**
     * Bind `values` to consecutive placeholders starting at `first`.
     */
    Result<void, Error> bind_all(const std::vector<SqlValue>& values, int first = 1);

    // Column getters
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] double column_double(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;
    [[nodiscard]] std::optional<Uuid> column_uuid(int index) const;

    // Execute
    Result<bool, Error> step();  // Returns true if there's a row
    Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite database wrapper.
 *
 * Provides a safe, functional interface to SQLite with:
 * - RAII connection management
 * - Transaction support (BEGIN IMMEDIATE)
 * - Optional statement tracing to the blockstore.sql log category
 * - Error handling via Result type
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
     * Open a database connection. Foreign keys are enforced; file
     * databases use WAL journaling.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    /**
     * Check if the database is open.
     */
    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    /**
     * Close the database connection.
     */
    void close();

    /**
     * Get the raw SQLite handle (use with caution).
     */
    [[nodiscard]] sqlite3* handle() const { return db_; }

    /**
     * Log every executed statement, with bound parameters expanded, at
     * debug level on blockstore.sql.
     */
    void set_tracing(bool enabled);

    /**
     * Prepare a SQL statement.
     */
    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute a SQL statement without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Execute a SQL statement and process results with a callback.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(
        const std::string& sql,
        const std::vector<SqlValue>& params,
        F&& callback
    ) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(params);
        if (bind_result.is_err()) {
            return bind_result;
        }
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            auto row_result = callback(stmt);
            if (row_result.is_err()) {
                return row_result;
            }
        }

        return Result<void, Error>::ok();
    }

    /**
     * Prepare, bind and run a statement that returns no rows.
     * Returns the number of rows changed.
     */
    [[nodiscard]] Result<int, Error> run(const std::string& sql, const std::vector<SqlValue>& params);

    /**
     * Begin a write transaction (takes the write lock up front).
     */
    [[nodiscard]] Result<void, Error> begin_transaction();

    /**
     * Commit the current transaction.
     */
    [[nodiscard]] Result<void, Error> commit();

    /**
     * Rollback the current transaction.
     */
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * True while a transaction is open on this connection.
     */
    [[nodiscard]] bool in_transaction() const;

    /**
     * Execute a function within a transaction.
     * Automatically commits on success, rolls back on failure. When a
     * transaction is already open, `f` joins it.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        if (in_transaction()) {
            return f();
        }

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            abandon_transaction();
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            abandon_transaction();
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    /**
     * Get the number of rows changed by the last statement.
     */
    [[nodiscard]] int changes() const;

    /**
     * Get the last error message.
     */
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    // Rolls back after a failure; a failed rollback is logged because
    // the original error is the one reported to the caller.
    void abandon_transaction();

    sqlite3* db_ = nullptr;
};

} // namespace blockstore::storage
