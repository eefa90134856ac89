#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/database.hpp"
#include <functional>
#include <string>
#include <vector>

namespace tidemark::storage {

/**
 * MigrationRecord - Written once per applied migration, never changed.
 */
struct MigrationRecord {
    int version = 0;
    std::string name;
    Timestamp executed_at;

    bool operator==(const MigrationRecord&) const = default;
};

/**
 * MigrationError - Why a store could not be brought to the target version.
 *
 * A store that fails initialization must not be used.
 */
struct MigrationError {
    enum class Kind {
        Failed,                  // Step `version` failed and was rolled back
        UnsupportedNewerSchema,  // On-disk version is newer than this build
        StorageIO                // Bookkeeping tables could not be read/written
    };

    Kind kind = Kind::Failed;
    int version = 0;
    std::string cause;

    bool operator==(const MigrationError&) const = default;
};

[[nodiscard]] std::string describe(const MigrationError& error);

using MigrationStep = std::function<Result<void>(Database&)>;

/**
 * Migration - One schema/data step.
 *
 * `up` runs inside a transaction together with the MigrationRecord insert.
 * `down` is optional; only migrations that document a downgrade path set it.
 */
struct Migration {
    int version = 0;
    std::string name;
    MigrationStep up;
    MigrationStep down;
};

/**
 * Migrations compiled into this build, in ascending version order.
 */
[[nodiscard]] const std::vector<Migration>& builtin_migrations();

/**
 * Create the entity table for `collection` and register it. For use from
 * migration steps.
 */
[[nodiscard]] Result<void> create_collection(Database& db,
                                             const std::string& collection,
                                             RevisionScheme scheme);

[[nodiscard]] Result<void> drop_collection(Database& db, const std::string& collection);

/**
 * Name of the SQL table backing a collection.
 */
[[nodiscard]] std::string entity_table_name(const std::string& collection);

struct MigrationStatus {
    int current_version = 0;
    int latest_version = 0;
    std::vector<MigrationRecord> applied;
    std::vector<int> pending;

    [[nodiscard]] bool up_to_date() const { return pending.empty(); }
};

using AppliedVersions = std::vector<int>;

/**
 * MigrationManager - Brings a store from its on-disk version to a target.
 *
 * Every migration in (persisted, target] runs in ascending order, each in its
 * own transaction. A migration whose record already exists is skipped, so
 * re-running after a crash is safe. The first failure stops the run and
 * leaves the store at the last successfully applied version.
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db,
                              std::vector<Migration> migrations = builtin_migrations(),
                              const Clock* clock = nullptr);

    /**
     * Migrate to the newest compiled migration.
     */
    [[nodiscard]] Result<AppliedVersions, MigrationError> initialize();

    [[nodiscard]] Result<AppliedVersions, MigrationError> initialize(int target_version);

    /**
     * Explicit downgrade. Runs `down` steps newest first; refuses before
     * touching anything if a step in range has no `down`.
     */
    [[nodiscard]] Result<AppliedVersions, MigrationError> rollback_to(int target_version);

    [[nodiscard]] Result<int, MigrationError> current_version();
    [[nodiscard]] Result<std::vector<MigrationRecord>, MigrationError> records();
    [[nodiscard]] Result<MigrationStatus, MigrationError> status();

    [[nodiscard]] int latest_version() const;

private:
    Database& db_;
    std::vector<Migration> migrations_;
    SystemClock system_clock_;
    const Clock* clock_;

    [[nodiscard]] Result<void, MigrationError> validate_migrations() const;
    [[nodiscard]] Result<void, MigrationError> ensure_bookkeeping();
    [[nodiscard]] Result<void> apply(const Migration& m);
    [[nodiscard]] Result<void> revert(const Migration& m);
};

} // namespace tidemark::storage
