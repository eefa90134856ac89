#include "storage/migrations.hpp"

#include <algorithm>
#include <utility>

namespace tidemark::storage {

namespace {

Result<void> exec(Database& db, const char* sql) {
    return db.execute(sql);
}

MigrationError storage_failure(const Error& e) {
    return MigrationError{MigrationError::Kind::StorageIO, 0, e.message};
}

// Runs `body` for every registered collection.
template<typename F>
Result<void> for_each_collection(Database& db, F&& body) {
    std::vector<std::string> names;
    auto listed = db.query("SELECT name FROM collections ORDER BY name;",
                           [&](Statement& stmt) { names.push_back(stmt.column_text(0)); });
    if (listed.is_err()) return listed;

    for (const auto& name : names) {
        auto r = body(name);
        if (r.is_err()) return r;
    }
    return Result<void>::ok();
}

// ----------------------------------------------------------------------------
// Built-in steps
// ----------------------------------------------------------------------------

Result<void> v1_sync_infrastructure_up(Database& db) {
    return exec(db, R"SQL(
        CREATE TABLE collections (
            name TEXT PRIMARY KEY,
            table_name TEXT NOT NULL UNIQUE,
            revision_scheme TEXT NOT NULL
        );

        CREATE TABLE sync_queue (
            sequence INTEGER PRIMARY KEY AUTOINCREMENT,
            collection TEXT NOT NULL,
            entity_id TEXT NOT NULL,
            operation TEXT NOT NULL,
            payload TEXT NOT NULL DEFAULT '',
            attempt_count INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL,
            last_error TEXT NOT NULL DEFAULT '',
            dead_letter INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX idx_sync_queue_key ON sync_queue(collection, entity_id, sequence);

        CREATE TABLE sync_cursors (
            collection TEXT PRIMARY KEY,
            cursor TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )SQL");
}

Result<void> v1_sync_infrastructure_down(Database& db) {
    return exec(db, R"SQL(
        DROP TABLE IF EXISTS sync_cursors;
        DROP TABLE IF EXISTS sync_queue;
        DROP TABLE IF EXISTS collections;
    )SQL");
}

Result<void> v2_core_collections_up(Database& db) {
    auto profiles = create_collection(db, "profiles", RevisionScheme::ServerCounter);
    if (profiles.is_err()) return profiles;
    return create_collection(db, "posts", RevisionScheme::ServerCounter);
}

Result<void> v2_core_collections_down(Database& db) {
    auto posts = drop_collection(db, "posts");
    if (posts.is_err()) return posts;
    return drop_collection(db, "profiles");
}

Result<void> v3_social_collections_up(Database& db) {
    auto comments = create_collection(db, "comments", RevisionScheme::ServerCounter);
    if (comments.is_err()) return comments;
    return create_collection(db, "likes", RevisionScheme::Timestamp);
}

// Backoff scheduling needs a due time per item and an audit time for parked
// items. Existing rows become due immediately.
Result<void> v4_queue_backoff_up(Database& db) {
    return exec(db, R"SQL(
        ALTER TABLE sync_queue ADD COLUMN next_attempt_at INTEGER NOT NULL DEFAULT 0;
        ALTER TABLE sync_queue ADD COLUMN dead_lettered_at INTEGER;
        CREATE INDEX idx_sync_queue_due ON sync_queue(dead_letter, next_attempt_at);
    )SQL");
}

Result<void> v5_saved_posts_and_tombstone_index_up(Database& db) {
    auto saved = create_collection(db, "saved_posts", RevisionScheme::Timestamp);
    if (saved.is_err()) return saved;

    return for_each_collection(db, [&](const std::string& name) {
        const auto table = entity_table_name(name);
        return db.execute("CREATE INDEX IF NOT EXISTS idx_" + table + "_live ON " + table +
                          "(is_deleted, id);");
    });
}

// Server value an unresolved conflict was measured against, one row per
// entity. Kept until the application settles the conflict.
Result<void> v6_conflict_snapshots_up(Database& db) {
    return exec(db, R"SQL(
        CREATE TABLE conflict_snapshots (
            collection TEXT NOT NULL,
            entity_id TEXT NOT NULL,
            payload TEXT NOT NULL DEFAULT '',
            revision INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            is_deleted INTEGER NOT NULL DEFAULT 0,
            reason TEXT NOT NULL DEFAULT '',
            recorded_at INTEGER NOT NULL,
            PRIMARY KEY (collection, entity_id)
        );
    )SQL");
}

// Stories carry a server-maintained view count; follows and story views are
// append-mostly edges that only ever change by their own timestamps.
Result<void> v7_follows_and_stories_up(Database& db) {
    const std::pair<const char*, RevisionScheme> collections[] = {
        {"follows", RevisionScheme::Timestamp},
        {"stories", RevisionScheme::ServerCounter},
        {"story_views", RevisionScheme::Timestamp}
    };

    for (const auto& [name, scheme] : collections) {
        auto created = create_collection(db, name, scheme);
        if (created.is_err()) return created;

        const auto table = entity_table_name(name);
        auto indexed = db.execute("CREATE INDEX IF NOT EXISTS idx_" + table + "_live ON " + table +
                                  "(is_deleted, id);");
        if (indexed.is_err()) return indexed;
    }
    return Result<void>::ok();
}

} // namespace

std::string describe(const MigrationError& error) {
    switch (error.kind) {
        case MigrationError::Kind::Failed:
            return "migration " + std::to_string(error.version) + " failed: " + error.cause;
        case MigrationError::Kind::UnsupportedNewerSchema:
            return "store schema version " + std::to_string(error.version) +
                   " is newer than this build supports: " + error.cause;
        case MigrationError::Kind::StorageIO:
            return "migration bookkeeping failed: " + error.cause;
    }
    return error.cause;
}

const std::vector<Migration>& builtin_migrations() {
    static const std::vector<Migration> migrations = {
        {
            .version = 1,
            .name = "sync_infrastructure",
            .up = v1_sync_infrastructure_up,
            .down = v1_sync_infrastructure_down
        },
        {
            .version = 2,
            .name = "core_collections",
            .up = v2_core_collections_up,
            .down = v2_core_collections_down
        },
        {
            .version = 3,
            .name = "social_collections",
            .up = v3_social_collections_up,
            .down = {}
        },
        {
            .version = 4,
            .name = "queue_backoff",
            .up = v4_queue_backoff_up,
            .down = {}
        },
        {
            .version = 5,
            .name = "saved_posts_and_tombstone_index",
            .up = v5_saved_posts_and_tombstone_index_up,
            .down = {}
        },
        {
            .version = 6,
            .name = "conflict_snapshots",
            .up = v6_conflict_snapshots_up,
            .down = {}
        },
        {
            .version = 7,
            .name = "follows_and_stories",
            .up = v7_follows_and_stories_up,
            .down = {}
        }
    };
    return migrations;
}

std::string entity_table_name(const std::string& collection) {
    return "entities_" + collection;
}

Result<void> create_collection(Database& db, const std::string& collection, RevisionScheme scheme) {
    if (!is_safe_identifier(collection)) {
        return Result<void>::err(Error{ErrorKind::InvalidArgument,
                                       "Invalid collection name: " + collection});
    }
    const auto table = entity_table_name(collection);

    auto created = db.execute(
        "CREATE TABLE " + table + " ("
        "  id TEXT PRIMARY KEY,"
        "  payload TEXT NOT NULL DEFAULT '',"
        "  revision INTEGER NOT NULL DEFAULT 0,"
        "  updated_at INTEGER NOT NULL,"
        "  is_deleted INTEGER NOT NULL DEFAULT 0,"
        "  sync_state TEXT NOT NULL DEFAULT 'clean'"
        ");");
    if (created.is_err()) return created;

    return db.execute_bound(
        "INSERT INTO collections (name, table_name, revision_scheme) VALUES (?, ?, ?);",
        [&](Statement& stmt) {
            return stmt.bind_text(1, collection)
                .and_then([&] { return stmt.bind_text(2, table); })
                .and_then([&] { return stmt.bind_text(3, to_string(scheme)); });
        });
}

Result<void> drop_collection(Database& db, const std::string& collection) {
    if (!is_safe_identifier(collection)) {
        return Result<void>::err(Error{ErrorKind::InvalidArgument,
                                       "Invalid collection name: " + collection});
    }
    auto dropped = db.execute("DROP TABLE IF EXISTS " + entity_table_name(collection) + ";");
    if (dropped.is_err()) return dropped;

    return db.execute_bound("DELETE FROM collections WHERE name = ?;", [&](Statement& stmt) {
        return stmt.bind_text(1, collection);
    });
}

// ============================================================================
// MigrationManager
// ============================================================================

MigrationManager::MigrationManager(Database& db, std::vector<Migration> migrations, const Clock* clock)
    : db_(db), migrations_(std::move(migrations)), clock_(clock ? clock : &system_clock_) {}

int MigrationManager::latest_version() const {
    return migrations_.empty() ? 0 : migrations_.back().version;
}

Result<void, MigrationError> MigrationManager::validate_migrations() const {
    int previous = 0;
    for (const auto& m : migrations_) {
        if (m.version <= previous) {
            return Result<void, MigrationError>::err(MigrationError{
                MigrationError::Kind::Failed, m.version,
                "migration versions must be unique and strictly ascending"});
        }
        if (!m.up) {
            return Result<void, MigrationError>::err(MigrationError{
                MigrationError::Kind::Failed, m.version, "migration has no up step"});
        }
        previous = m.version;
    }
    return Result<void, MigrationError>::ok();
}

Result<void, MigrationError> MigrationManager::ensure_bookkeeping() {
    auto created = db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            executed_at INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS schema_version (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            version INTEGER NOT NULL
        );
        INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);
    )SQL");
    if (created.is_err()) {
        return Result<void, MigrationError>::err(storage_failure(created.unwrap_err()));
    }
    return Result<void, MigrationError>::ok();
}

Result<int, MigrationError> MigrationManager::current_version() {
    auto ensured = ensure_bookkeeping();
    if (ensured.is_err()) return propagate<Result<int, MigrationError>>(std::move(ensured));

    int version = 0;
    auto read = db_.query("SELECT version FROM schema_version WHERE id = 1;",
                          [&](Statement& stmt) { version = stmt.column_int(0); });
    if (read.is_err()) {
        return Result<int, MigrationError>::err(storage_failure(read.unwrap_err()));
    }
    return Result<int, MigrationError>::ok(version);
}

Result<std::vector<MigrationRecord>, MigrationError> MigrationManager::records() {
    using R = Result<std::vector<MigrationRecord>, MigrationError>;

    auto ensured = ensure_bookkeeping();
    if (ensured.is_err()) return propagate<R>(std::move(ensured));

    std::vector<MigrationRecord> out;
    auto read = db_.query(
        "SELECT version, name, executed_at FROM schema_migrations ORDER BY version;",
        [&](Statement& stmt) {
            out.push_back(MigrationRecord{
                .version = stmt.column_int(0),
                .name = stmt.column_text(1),
                .executed_at = Timestamp(stmt.column_int64(2))
            });
        });
    if (read.is_err()) return R::err(storage_failure(read.unwrap_err()));
    return R::ok(std::move(out));
}

Result<MigrationStatus, MigrationError> MigrationManager::status() {
    using R = Result<MigrationStatus, MigrationError>;

    auto current = current_version();
    if (current.is_err()) return propagate<R>(std::move(current));
    auto applied = records();
    if (applied.is_err()) return propagate<R>(std::move(applied));

    MigrationStatus status{
        .current_version = current.unwrap(),
        .latest_version = latest_version(),
        .applied = std::move(applied).unwrap(),
        .pending = {}
    };
    for (const auto& m : migrations_) {
        const bool done = std::any_of(status.applied.begin(), status.applied.end(),
                                      [&](const MigrationRecord& r) { return r.version == m.version; });
        if (!done) status.pending.push_back(m.version);
    }
    return R::ok(std::move(status));
}

Result<void> MigrationManager::apply(const Migration& m) {
    return db_.transaction([&]() -> Result<void> {
        auto check = db_.prepare("SELECT 1 FROM schema_migrations WHERE version = ?;");
        if (check.is_err()) return propagate<Result<void>>(std::move(check));
        auto stmt = std::move(check).unwrap();
        auto bound = stmt.bind_int(1, m.version);
        if (bound.is_err()) return bound;
        auto row = stmt.step();
        if (row.is_err()) return propagate<Result<void>>(std::move(row));
        const bool already_recorded = row.unwrap();
        // An unfinished read would block DROP TABLE inside `up`.
        auto released = stmt.reset();
        if (released.is_err()) return released;

        if (!already_recorded) {
            auto up = m.up(db_);
            if (up.is_err()) return up;

            auto recorded = db_.execute_bound(
                "INSERT INTO schema_migrations (version, name, executed_at) VALUES (?, ?, ?);",
                [&](Statement& s) {
                    return s.bind_int(1, m.version)
                        .and_then([&] { return s.bind_text(2, m.name); })
                        .and_then([&] { return s.bind_int64(3, clock_->now().millis()); });
                });
            if (recorded.is_err()) return recorded;
        }

        return db_.execute_bound(
            "UPDATE schema_version SET version = MAX(version, ?) WHERE id = 1;",
            [&](Statement& s) { return s.bind_int(1, m.version); });
    });
}

Result<void> MigrationManager::revert(const Migration& m) {
    return db_.transaction([&]() -> Result<void> {
        auto down = m.down(db_);
        if (down.is_err()) return down;

        auto erased = db_.execute_bound("DELETE FROM schema_migrations WHERE version = ?;",
                                        [&](Statement& s) { return s.bind_int(1, m.version); });
        if (erased.is_err()) return erased;

        // The version drops to the newest migration still below this one.
        int below = 0;
        for (const auto& other : migrations_) {
            if (other.version < m.version) below = other.version;
        }
        return db_.execute_bound("UPDATE schema_version SET version = ? WHERE id = 1;",
                                 [&](Statement& s) { return s.bind_int(1, below); });
    });
}

Result<AppliedVersions, MigrationError> MigrationManager::initialize() {
    return initialize(latest_version());
}

Result<AppliedVersions, MigrationError> MigrationManager::initialize(int target_version) {
    using R = Result<AppliedVersions, MigrationError>;

    auto valid = validate_migrations();
    if (valid.is_err()) return propagate<R>(std::move(valid));

    auto current_result = current_version();
    if (current_result.is_err()) return propagate<R>(std::move(current_result));
    const int current = current_result.unwrap();

    if (current > target_version) {
        return R::err(MigrationError{
            MigrationError::Kind::UnsupportedNewerSchema, current,
            "target version is " + std::to_string(target_version)});
    }
    if (target_version > latest_version()) {
        return R::err(MigrationError{
            MigrationError::Kind::Failed, target_version,
            "no migration is compiled in for this version"});
    }

    AppliedVersions applied;
    for (const auto& m : migrations_) {
        if (m.version <= current || m.version > target_version) continue;

        auto result = apply(m);
        if (result.is_err()) {
            return R::err(MigrationError{MigrationError::Kind::Failed, m.version,
                                         m.name + ": " + result.unwrap_err().message});
        }
        applied.push_back(m.version);
    }
    return R::ok(std::move(applied));
}

Result<AppliedVersions, MigrationError> MigrationManager::rollback_to(int target_version) {
    using R = Result<AppliedVersions, MigrationError>;

    auto current_result = current_version();
    if (current_result.is_err()) return propagate<R>(std::move(current_result));
    const int current = current_result.unwrap();

    if (current <= target_version) return R::ok({});

    std::vector<const Migration*> steps;
    for (auto it = migrations_.rbegin(); it != migrations_.rend(); ++it) {
        if (it->version > current || it->version <= target_version) continue;
        if (!it->down) {
            return R::err(MigrationError{MigrationError::Kind::Failed, it->version,
                                         it->name + " does not support downgrade"});
        }
        steps.push_back(&*it);
    }

    AppliedVersions reverted;
    for (const auto* m : steps) {
        auto result = revert(*m);
        if (result.is_err()) {
            return R::err(MigrationError{MigrationError::Kind::Failed, m->version,
                                         m->name + " rollback: " + result.unwrap_err().message});
        }
        reverted.push_back(m->version);
    }
    return R::ok(std::move(reverted));
}

} // namespace tidemark::storage
