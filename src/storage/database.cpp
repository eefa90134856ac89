#include "storage/database.hpp"

namespace tidemark::storage {

namespace {

Result<void> bind_status(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Result<void>::err(Error{ErrorKind::StorageIO, std::string("Failed to bind ") + what, rc});
    }
    return Result<void>::ok();
}

constexpr int kBusyTimeoutMs = 5000;

} // namespace

// ============================================================================
// Statement
// ============================================================================

Result<void> Statement::bind_text(int index, std::string_view text) {
    return bind_status(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                         static_cast<int>(text.size()), SQLITE_TRANSIENT),
                       "text");
}

Result<void> Statement::bind_int(int index, int value) {
    return bind_status(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

Result<void> Statement::bind_int64(int index, int64_t value) {
    return bind_status(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

Result<void> Statement::bind_null(int index) {
    return bind_status(sqlite3_bind_null(stmt_.get(), index), "null");
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return {};
    const int size = sqlite3_column_bytes(stmt_.get(), index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool> Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) return Result<bool>::ok(true);
    if (rc == SQLITE_DONE) return Result<bool>::ok(false);

    sqlite3* db = sqlite3_db_handle(stmt_.get());
    std::string message = db ? sqlite3_errmsg(db) : "Step failed";
    return Result<bool>::err(Error{ErrorKind::StorageIO, std::move(message), rc});
}

Result<void> Statement::reset() {
    const int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void>::err(Error{ErrorKind::StorageIO, "Reset failed", rc});
    }
    return Result<void>::ok();
}

Result<void> Statement::run() {
    while (true) {
        auto step_result = step();
        if (step_result.is_err()) return propagate<Result<void>>(std::move(step_result));
        if (!step_result.unwrap()) return Result<void>::ok();
    }
}

// ============================================================================
// Database
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = raw ? sqlite3_errmsg(raw) : "Unable to allocate SQLite handle";
        if (raw) sqlite3_close(raw);
        return Result<Database>::err(
            Error{ErrorKind::StorageIO, "Failed to open " + path + ": " + message, rc});
    }

    Database db(raw, path);
    sqlite3_busy_timeout(raw, kBusyTimeoutMs);

    auto pragmas = db.execute("PRAGMA foreign_keys = ON;");
    if (pragmas.is_err()) return propagate<Result<Database>>(std::move(pragmas));

    // WAL is not available for :memory: databases; SQLite reports "memory" there.
    if (path != ":memory:") {
        auto wal = db.execute("PRAGMA journal_mode = WAL; PRAGMA synchronous = NORMAL;");
        if (wal.is_err()) return propagate<Result<Database>>(std::move(wal));
    }

    return Result<Database>::ok(std::move(db));
}

Result<Database> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Error Database::make_error(const std::string& context, int rc) const {
    return Error{ErrorKind::StorageIO, context + ": " + last_error(), rc};
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement>::err(Error{ErrorKind::StorageIO, "Database not open", SQLITE_MISUSE});
    }
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement>::err(make_error("Prepare failed", rc));
    }
    return Result<Statement>::ok(Statement(stmt));
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void>::err(Error{ErrorKind::StorageIO, "Database not open", SQLITE_MISUSE});
    }
    char* error_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void>::err(Error{ErrorKind::StorageIO, std::move(message), rc});
    }
    return Result<void>::ok();
}

Result<void> Database::begin_transaction() {
    // IMMEDIATE takes the write lock up front so COMMIT cannot hit SQLITE_BUSY
    // after the work is done.
    return execute("BEGIN IMMEDIATE;");
}

Result<void> Database::commit() {
    return execute("COMMIT;");
}

Result<void> Database::rollback() {
    return execute("ROLLBACK;");
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

Result<bool> Database::table_exists(const std::string& name) {
    auto stmt_result = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
    if (stmt_result.is_err()) return propagate<Result<bool>>(std::move(stmt_result));

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, name);
    if (bound.is_err()) return propagate<Result<bool>>(std::move(bound));
    return stmt.step();
}

// ============================================================================
// TransactionGuard
// ============================================================================

TransactionGuard::TransactionGuard(Database& db)
    : db_(db), begin_status_(db.begin_transaction()) {
    active_ = begin_status_.is_ok();
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        // Destructor path: the caller already has the error that unwound us.
        auto result = db_.rollback();
        (void)result;
    }
}

Result<void> TransactionGuard::commit() {
    if (!active_) {
        return Result<void>::err(Error{ErrorKind::StorageIO, "No active transaction"});
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

Result<void> TransactionGuard::rollback() {
    if (!active_) return Result<void>::ok();
    active_ = false;
    return db_.rollback();
}

// ============================================================================

bool is_safe_identifier(std::string_view name) {
    if (name.empty() || name.size() > 48) return false;
    if (name.front() < 'a' || name.front() > 'z') return false;
    for (char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}

} // namespace tidemark::storage
