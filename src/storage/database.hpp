#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tidemark::storage {

/**
 * Statement - Prepared statement, finalized when the last copy goes away.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Result<void> bind_text(int index, std::string_view text);
    Result<void> bind_int(int index, int value);
    Result<void> bind_int64(int index, int64_t value);
    Result<void> bind_null(int index);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    /**
     * Advance; Ok(true) when a row is available, Ok(false) when done.
     */
    Result<bool> step();
    Result<void> reset();

    /**
     * Step until SQLITE_DONE, discarding rows.
     */
    Result<void> run();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - Owns the single SQLite connection of a store.
 *
 * Opened with SQLITE_OPEN_FULLMUTEX so the handle may be shared between the
 * application thread and the sync thread; higher layers serialize writers.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database> open(const std::string& path);

    /**
     * Private in-memory database, used by tests.
     */
    [[nodiscard]] static Result<Database> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }
    [[nodiscard]] const std::string& path() const { return path_; }

    [[nodiscard]] Result<Statement> prepare(const std::string& sql);

    /**
     * Run one or more statements that return no rows.
     */
    [[nodiscard]] Result<void> execute(const std::string& sql);

    /**
     * Prepare, bind with `bind(stmt)` and run to completion.
     */
    template<typename Bind>
    [[nodiscard]] Result<void> execute_bound(const std::string& sql, Bind&& bind) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) return propagate<Result<void>>(std::move(stmt_result));
        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = bind(stmt);
        if (bind_result.is_err()) return bind_result;
        return stmt.run();
    }

    /**
     * Run a query and hand each row to `on_row`.
     */
    template<typename F>
    [[nodiscard]] Result<void> query(const std::string& sql, F&& on_row) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) return propagate<Result<void>>(std::move(stmt_result));
        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) return propagate<Result<void>>(std::move(step_result));
            if (!step_result.unwrap()) break;
            on_row(stmt);
        }
        return Result<void>::ok();
    }

    [[nodiscard]] Result<void> begin_transaction();
    [[nodiscard]] Result<void> commit();
    [[nodiscard]] Result<void> rollback();

    /**
     * Run `f` inside BEGIN IMMEDIATE / COMMIT.
     *
     * `f` returns a Result; an Err rolls back and is returned as-is. A failed
     * rollback is appended to the error message.
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
            auto rollback_result = rollback();
            (void)rollback_result;  // COMMIT failure already reported below
            return ResultType::err(commit_result.unwrap_err());
        }
        return result;
    }

    [[nodiscard]] int64_t last_insert_rowid() const;
    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

    /**
     * True if a table with this name exists.
     */
    [[nodiscard]] Result<bool> table_exists(const std::string& name);

private:
    Database(sqlite3* db, std::string path) : db_(db), path_(std::move(path)) {}

    [[nodiscard]] Error make_error(const std::string& context, int rc) const;

    sqlite3* db_ = nullptr;
    std::string path_;
};

/**
 * TransactionGuard - Rolls back on scope exit unless committed.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    /**
     * Error from BEGIN, if it failed.
     */
    [[nodiscard]] Result<void> status() const { return begin_status_; }

    [[nodiscard]] Result<void> commit();
    [[nodiscard]] Result<void> rollback();

    [[nodiscard]] bool is_active() const { return active_; }

private:
    Database& db_;
    Result<void> begin_status_;
    bool active_ = false;
};

/**
 * True for names usable as SQL identifiers without quoting:
 * [a-z][a-z0-9_]*, at most 48 characters.
 */
[[nodiscard]] bool is_safe_identifier(std::string_view name);

} // namespace tidemark::storage
