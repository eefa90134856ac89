#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <optional>

namespace tidemark {

/**
 * ConflictStrategy - Per-collection rule for picking a winner.
 */
enum class ConflictStrategy {
    RemoteWins,     // Server-authoritative data (counters)
    LocalWins,      // User-owned drafts; local value is pushed again
    LastWriteWins,  // Newer updated_at wins; ties go to the server
    FieldMerge      // Caller-supplied merge of both payloads
};

[[nodiscard]] constexpr std::string_view to_string(ConflictStrategy s) noexcept {
    switch (s) {
        case ConflictStrategy::RemoteWins: return "remote_wins";
        case ConflictStrategy::LocalWins: return "local_wins";
        case ConflictStrategy::LastWriteWins: return "last_write_wins";
        case ConflictStrategy::FieldMerge: return "field_merge";
    }
    return "last_write_wins";
}

[[nodiscard]] inline std::optional<ConflictStrategy> parse_conflict_strategy(std::string_view s) {
    if (s == "remote_wins") return ConflictStrategy::RemoteWins;
    if (s == "local_wins") return ConflictStrategy::LocalWins;
    if (s == "last_write_wins") return ConflictStrategy::LastWriteWins;
    if (s == "field_merge") return ConflictStrategy::FieldMerge;
    return std::nullopt;
}

enum class Resolution {
    LocalWins,
    RemoteWins,
    Merged
};

[[nodiscard]] constexpr std::string_view to_string(Resolution r) noexcept {
    switch (r) {
        case Resolution::LocalWins: return "local_wins";
        case Resolution::RemoteWins: return "remote_wins";
        case Resolution::Merged: return "merged";
    }
    return "remote_wins";
}

/**
 * MergeFunction - Combines two payloads into one.
 *
 * Must be a pure function of its arguments. An Err result leaves the entity
 * Conflicted for the application to settle.
 */
using MergeFunction =
    std::function<Result<std::string>(const Entity& local, const Entity& remote)>;

struct CollectionPolicy {
    ConflictStrategy strategy = ConflictStrategy::LastWriteWins;
    RevisionScheme revision_scheme = RevisionScheme::Timestamp;
    MergeFunction merge;
};

/**
 * ConflictRecord - Outcome of one resolution. Not persisted.
 *
 * `resolved` is the entity to commit. Its sync_state is Clean when the
 * server value stands and PendingPush when the result still has to be pushed.
 * `resolved_at` is the later of the two updated_at values so that the record
 * depends on nothing but its inputs.
 */
struct ConflictRecord {
    Entity local;
    Entity remote;
    Resolution resolution = Resolution::RemoteWins;
    Entity resolved;
    Timestamp resolved_at;

    [[nodiscard]] bool needs_push() const noexcept {
        return resolved.sync_state == SyncState::PendingPush;
    }

    bool operator==(const ConflictRecord&) const = default;
};

/**
 * ConflictResolver - Deterministic local-vs-remote arbitration.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(CollectionPolicy default_policy = {});

    void set_policy(const std::string& collection, CollectionPolicy policy);

    [[nodiscard]] const CollectionPolicy& policy_for(const std::string& collection) const;

    /**
     * Resolve a pair for the same (collection, id).
     *
     * Fails with ErrorKind::InvalidArgument if the keys differ and with
     * ErrorKind::ConflictResolution if a FieldMerge has no function or its
     * function fails.
     */
    [[nodiscard]] Result<ConflictRecord> resolve(const Entity& local, const Entity& remote) const;

private:
    CollectionPolicy default_policy_;
    std::map<std::string, CollectionPolicy> policies_;
};

} // namespace tidemark
