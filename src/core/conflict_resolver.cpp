#include "core/conflict_resolver.hpp"

#include <algorithm>

namespace tidemark {
namespace {

Entity take_remote(const Entity& remote) {
    Entity out = remote;
    out.sync_state = SyncState::Clean;
    return out;
}

// Local content on top of the server's revision, still to be pushed.
Entity take_local(const Entity& local, const Entity& remote) {
    Entity out = local;
    out.revision = std::max(local.revision, remote.revision);
    out.sync_state = SyncState::PendingPush;
    return out;
}

ConflictRecord make_record(const Entity& local,
                           const Entity& remote,
                           Resolution resolution,
                           Entity resolved) {
    return ConflictRecord{
        .local = local,
        .remote = remote,
        .resolution = resolution,
        .resolved = std::move(resolved),
        .resolved_at = std::max(local.updated_at, remote.updated_at)
    };
}

ConflictRecord last_write_wins(const Entity& local, const Entity& remote) {
    // Server clock is canonical on ties.
    if (local.updated_at > remote.updated_at) {
        return make_record(local, remote, Resolution::LocalWins, take_local(local, remote));
    }
    return make_record(local, remote, Resolution::RemoteWins, take_remote(remote));
}

} // namespace

ConflictResolver::ConflictResolver(CollectionPolicy default_policy)
    : default_policy_(std::move(default_policy)) {}

void ConflictResolver::set_policy(const std::string& collection, CollectionPolicy policy) {
    policies_[collection] = std::move(policy);
}

const CollectionPolicy& ConflictResolver::policy_for(const std::string& collection) const {
    auto it = policies_.find(collection);
    return it != policies_.end() ? it->second : default_policy_;
}

Result<ConflictRecord> ConflictResolver::resolve(const Entity& local, const Entity& remote) const {
    if (local.collection != remote.collection || local.id != remote.id) {
        return Result<ConflictRecord>::err(Error{
            ErrorKind::InvalidArgument,
            "Cannot resolve different entities: " + local.collection + "/" + local.id +
                " vs " + remote.collection + "/" + remote.id});
    }

    const auto& policy = policy_for(local.collection);

    switch (policy.strategy) {
        case ConflictStrategy::RemoteWins:
            return Result<ConflictRecord>::ok(
                make_record(local, remote, Resolution::RemoteWins, take_remote(remote)));

        case ConflictStrategy::LocalWins:
            return Result<ConflictRecord>::ok(
                make_record(local, remote, Resolution::LocalWins, take_local(local, remote)));

        case ConflictStrategy::LastWriteWins:
            return Result<ConflictRecord>::ok(last_write_wins(local, remote));

        case ConflictStrategy::FieldMerge:
            break;
    }

    // A tombstone has no fields to merge with.
    if (local.is_deleted || remote.is_deleted) {
        return Result<ConflictRecord>::ok(last_write_wins(local, remote));
    }

    if (!policy.merge) {
        return Result<ConflictRecord>::err(Error{
            ErrorKind::ConflictResolution,
            "No merge function configured for collection " + local.collection});
    }

    auto merged = policy.merge(local, remote);
    if (merged.is_err()) {
        return Result<ConflictRecord>::err(Error{
            ErrorKind::ConflictResolution,
            "Merge of " + local.collection + "/" + local.id + " failed: " +
                merged.unwrap_err().message});
    }

    Entity resolved = remote;
    resolved.payload = std::move(merged).unwrap();
    resolved.revision = std::max(local.revision, remote.revision);
    resolved.updated_at = std::max(local.updated_at, remote.updated_at);
    resolved.is_deleted = false;
    // Identical to the server value means nothing left to push.
    resolved.sync_state = resolved.payload == remote.payload ? SyncState::Clean
                                                             : SyncState::PendingPush;

    return Result<ConflictRecord>::ok(
        make_record(local, remote, Resolution::Merged, std::move(resolved)));
}

} // namespace tidemark
