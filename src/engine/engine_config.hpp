#pragma once

#include "core/conflict_resolver.hpp"
#include "core/entity.hpp"
#include "core/result.hpp"
#include "core/retry_policy.hpp"
#include <QSettings>
#include <QString>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace tidemark::engine {

// Oldest schema the engine can run against (queue backoff, conflict snapshots).
constexpr int kRequiredSchemaVersion = 6;

/**
 * CollectionConfig - Conflict handling for one collection.
 */
struct CollectionConfig {
    ConflictStrategy strategy = ConflictStrategy::LastWriteWins;
    // Checked against the registry at open; the registry is authoritative.
    std::optional<RevisionScheme> revision_scheme;
    // FieldMerge: fields whose local value survives a merge.
    std::set<std::string> local_fields;
    // FieldMerge: replaces the JSON merge over `local_fields` when set.
    MergeFunction merge;
};

struct EngineConfig {
    std::string database_path;
    std::optional<int> target_schema_version;
    RetryPolicy retry;
    size_t drain_batch_size = 50;
    std::chrono::milliseconds periodic_sync_interval{0};
    ConflictStrategy default_strategy = ConflictStrategy::LastWriteWins;
    std::map<std::string, CollectionConfig> collections;

    /**
     * Read [storage], [retry], [sync] and [collections/<name>] groups.
     * TIDEMARK_DB_PATH overrides storage/path.
     */
    [[nodiscard]] static Result<EngineConfig> from_settings(QSettings& settings);

    [[nodiscard]] Result<void> validate() const;
};

/**
 * Default database location under the per-user app data directory.
 */
[[nodiscard]] QString default_database_path();

} // namespace tidemark::engine
