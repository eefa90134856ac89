#include "storage/local_store.hpp"

#include <algorithm>

namespace tidemark::storage {

namespace {

constexpr const char* kEntityColumns = "id, payload, revision, updated_at, is_deleted, sync_state";

Error not_found(const std::string& collection, const std::string& id) {
    return Error{ErrorKind::NotFound, "No entity " + collection + "/" + id};
}

} // namespace

// ============================================================================
// EntitySequence
// ============================================================================

EntitySequence::EntitySequence(LocalStore& store,
                               std::string collection,
                               EntityPredicate predicate,
                               ReadOptions options,
                               size_t page_size)
    : store_(&store),
      collection_(std::move(collection)),
      predicate_(std::move(predicate)),
      options_(options),
      page_size_(page_size == 0 ? 1 : page_size) {}

void EntitySequence::restart() {
    after_id_.reset();
    buffer_.clear();
    exhausted_ = false;
}

Result<void> EntitySequence::fill() {
    while (buffer_.empty() && !exhausted_) {
        auto rows = store_->page(collection_, after_id_, page_size_);
        if (rows.is_err()) return propagate<Result<void>>(std::move(rows));

        auto page = std::move(rows).unwrap();
        if (page.size() < page_size_) exhausted_ = true;
        if (!page.empty()) after_id_ = page.back().id;

        for (auto& entity : page) {
            if (entity.is_deleted && !options_.include_tombstones) continue;
            if (predicate_ && !predicate_(entity)) continue;
            buffer_.push_back(std::move(entity));
        }
    }
    return Result<void>::ok();
}

Result<std::optional<Entity>> EntitySequence::next() {
    auto filled = fill();
    if (filled.is_err()) return propagate<Result<std::optional<Entity>>>(std::move(filled));
    if (buffer_.empty()) return Result<std::optional<Entity>>::ok(std::nullopt);

    Entity front = std::move(buffer_.front());
    buffer_.pop_front();
    return Result<std::optional<Entity>>::ok(std::move(front));
}

Result<std::vector<Entity>> EntitySequence::collect() {
    std::vector<Entity> out;
    while (true) {
        auto item = next();
        if (item.is_err()) return propagate<Result<std::vector<Entity>>>(std::move(item));
        auto value = std::move(item).unwrap();
        if (!value) break;
        out.push_back(std::move(*value));
    }
    return Result<std::vector<Entity>>::ok(std::move(out));
}

// ============================================================================
// StoreTransaction
// ============================================================================

Result<std::optional<Entity>> StoreTransaction::load(const EntityKey& key) {
    return store_.load_unlocked(key);
}

Result<void> StoreTransaction::save(const Entity& entity) {
    return store_.save_unlocked(entity);
}

Result<void> StoreTransaction::purge(const EntityKey& key) {
    return store_.purge_unlocked(key);
}

Result<int64_t> StoreTransaction::enqueue(Operation op, const Entity& entity) {
    return store_.queue_.enqueue(QueueItem{
        .sequence = 0,
        .collection = entity.collection,
        .id = entity.id,
        .operation = op,
        .payload = op == Operation::Delete ? std::string{} : entity.payload
    });
}

Result<void> StoreTransaction::set_cursor(const std::string& collection, const std::string& cursor) {
    return store_.db_.execute_bound(R"SQL(
        INSERT INTO sync_cursors (collection, cursor, updated_at) VALUES (?, ?, ?)
        ON CONFLICT(collection) DO UPDATE SET
            cursor = excluded.cursor,
            updated_at = excluded.updated_at;
    )SQL", [&](Statement& stmt) {
        return stmt.bind_text(1, collection)
            .and_then([&] { return stmt.bind_text(2, cursor); })
            .and_then([&] { return stmt.bind_int64(3, store_.clock_.now().millis()); });
    });
}

SyncQueue& StoreTransaction::queue() {
    return store_.queue_;
}

Result<Entity> StoreTransaction::apply_remote(const Entity& remote) {
    Entity entity = remote;
    entity.sync_state = SyncState::Clean;

    auto settled = settle_conflict(key_of(entity));
    if (settled.is_err()) return propagate<Result<Entity>>(std::move(settled));

    auto written = entity.is_deleted ? purge(key_of(entity)) : save(entity);
    if (written.is_err()) return propagate<Result<Entity>>(std::move(written));
    return Result<Entity>::ok(std::move(entity));
}

Result<void> StoreTransaction::mark_conflicted(const Entity& local,
                                               const Entity& remote,
                                               const std::string& reason) {
    Entity conflicted = local;
    conflicted.sync_state = SyncState::Conflicted;
    auto saved = save(conflicted);
    if (saved.is_err()) return saved;

    // Nothing for this key may reach the server until the application decides.
    auto pending = store_.queue_.pending_for(key_of(local));
    if (pending.is_err()) return propagate<Result<void>>(std::move(pending));
    for (const auto& item : pending.unwrap()) {
        auto parked = store_.queue_.dead_letter(item.sequence, kParkedForConflict);
        if (parked.is_err()) return parked;
    }

    return store_.db_.execute_bound(R"SQL(
        INSERT INTO conflict_snapshots
            (collection, entity_id, payload, revision, updated_at, is_deleted, reason, recorded_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(collection, entity_id) DO UPDATE SET
            payload = excluded.payload,
            revision = excluded.revision,
            updated_at = excluded.updated_at,
            is_deleted = excluded.is_deleted,
            reason = excluded.reason,
            recorded_at = excluded.recorded_at;
    )SQL", [&](Statement& stmt) {
        return stmt.bind_text(1, local.collection)
            .and_then([&] { return stmt.bind_text(2, local.id); })
            .and_then([&] { return stmt.bind_text(3, remote.payload); })
            .and_then([&] { return stmt.bind_int64(4, remote.revision); })
            .and_then([&] { return stmt.bind_int64(5, remote.updated_at.millis()); })
            .and_then([&] { return stmt.bind_int(6, remote.is_deleted ? 1 : 0); })
            .and_then([&] { return stmt.bind_text(7, reason); })
            .and_then([&] { return stmt.bind_int64(8, store_.clock_.now().millis()); });
    });
}

Result<void> StoreTransaction::settle_conflict(const EntityKey& key) {
    auto parked = store_.queue_.dead_letters_for(key);
    if (parked.is_err()) return propagate<Result<void>>(std::move(parked));
    for (const auto& item : parked.unwrap()) {
        if (item.last_error != kParkedForConflict) continue;
        auto discarded = store_.queue_.discard_dead_letter(item.sequence);
        if (discarded.is_err()) return discarded;
    }

    return store_.db_.execute_bound(
        "DELETE FROM conflict_snapshots WHERE collection = ? AND entity_id = ?;",
        [&](Statement& stmt) {
            return stmt.bind_text(1, key.collection)
                .and_then([&] { return stmt.bind_text(2, key.id); });
        });
}

// ============================================================================
// LocalStore
// ============================================================================

LocalStore::LocalStore(Database& db, SyncQueue& queue, const Clock& clock)
    : db_(db), queue_(queue), clock_(clock) {}

Result<void> LocalStore::load_registry() {
    std::map<std::string, CollectionInfo> loaded;
    auto read = db_.query("SELECT name, table_name, revision_scheme FROM collections;",
                          [&](Statement& stmt) {
                              loaded[stmt.column_text(0)] = CollectionInfo{
                                  .table = stmt.column_text(1),
                                  .scheme = parse_revision_scheme(stmt.column_text(2))
                                                .value_or(RevisionScheme::Timestamp)
                              };
                          });
    if (read.is_err()) return read;

    std::unique_lock lock(registry_mutex_);
    registry_ = std::move(loaded);
    return Result<void>::ok();
}

std::vector<std::string> LocalStore::collections() const {
    std::shared_lock lock(registry_mutex_);
    std::vector<std::string> names;
    names.reserve(registry_.size());
    for (const auto& [name, info] : registry_) names.push_back(name);
    return names;
}

Result<RevisionScheme> LocalStore::revision_scheme(const std::string& collection) const {
    std::shared_lock lock(registry_mutex_);
    auto it = registry_.find(collection);
    if (it == registry_.end()) {
        return Result<RevisionScheme>::err(
            Error{ErrorKind::UnknownCollection, "Unknown collection: " + collection});
    }
    return Result<RevisionScheme>::ok(it->second.scheme);
}

Result<std::string> LocalStore::table_for(const std::string& collection) const {
    std::shared_lock lock(registry_mutex_);
    auto it = registry_.find(collection);
    if (it == registry_.end()) {
        return Result<std::string>::err(
            Error{ErrorKind::UnknownCollection, "Unknown collection: " + collection});
    }
    return Result<std::string>::ok(it->second.table);
}

Entity LocalStore::row_to_entity(const std::string& collection, Statement& stmt) const {
    return Entity{
        .collection = collection,
        .id = stmt.column_text(0),
        .payload = stmt.column_text(1),
        .revision = stmt.column_int64(2),
        .updated_at = Timestamp(stmt.column_int64(3)),
        .is_deleted = stmt.column_int(4) != 0,
        .sync_state = parse_sync_state(stmt.column_text(5)).value_or(SyncState::Clean)
    };
}

Result<std::optional<Entity>> LocalStore::load_unlocked(const EntityKey& key) {
    using R = Result<std::optional<Entity>>;

    auto table = table_for(key.collection);
    if (table.is_err()) return propagate<R>(std::move(table));

    auto stmt_result = db_.prepare(std::string("SELECT ") + kEntityColumns + " FROM " +
                                   table.unwrap() + " WHERE id = ?;");
    if (stmt_result.is_err()) return propagate<R>(std::move(stmt_result));

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, key.id);
    if (bound.is_err()) return propagate<R>(std::move(bound));

    auto row = stmt.step();
    if (row.is_err()) return propagate<R>(std::move(row));
    if (!row.unwrap()) return R::ok(std::nullopt);
    return R::ok(row_to_entity(key.collection, stmt));
}

Result<void> LocalStore::save_unlocked(const Entity& entity) {
    auto table = table_for(entity.collection);
    if (table.is_err()) return propagate<Result<void>>(std::move(table));

    return db_.execute_bound(
        "INSERT INTO " + table.unwrap() + " (" + kEntityColumns + ") VALUES (?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET "
        "  payload = excluded.payload,"
        "  revision = excluded.revision,"
        "  updated_at = excluded.updated_at,"
        "  is_deleted = excluded.is_deleted,"
        "  sync_state = excluded.sync_state;",
        [&](Statement& stmt) {
            return stmt.bind_text(1, entity.id)
                .and_then([&] { return stmt.bind_text(2, entity.payload); })
                .and_then([&] { return stmt.bind_int64(3, entity.revision); })
                .and_then([&] { return stmt.bind_int64(4, entity.updated_at.millis()); })
                .and_then([&] { return stmt.bind_int(5, entity.is_deleted ? 1 : 0); })
                .and_then([&] { return stmt.bind_text(6, to_string(entity.sync_state)); });
        });
}

Result<void> LocalStore::purge_unlocked(const EntityKey& key) {
    auto table = table_for(key.collection);
    if (table.is_err()) return propagate<Result<void>>(std::move(table));

    return db_.execute_bound("DELETE FROM " + table.unwrap() + " WHERE id = ?;",
                             [&](Statement& stmt) { return stmt.bind_text(1, key.id); });
}

Result<std::vector<Entity>> LocalStore::page_unlocked(const std::string& collection,
                                                      const std::optional<std::string>& after_id,
                                                      size_t limit) {
    using R = Result<std::vector<Entity>>;

    auto table = table_for(collection);
    if (table.is_err()) return propagate<R>(std::move(table));

    const std::string sql = std::string("SELECT ") + kEntityColumns + " FROM " + table.unwrap() +
                            (after_id ? " WHERE id > ?1" : "") + " ORDER BY id LIMIT ?2;";
    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) return propagate<R>(std::move(stmt_result));

    auto stmt = std::move(stmt_result).unwrap();
    if (after_id) {
        auto bound = stmt.bind_text(1, *after_id);
        if (bound.is_err()) return propagate<R>(std::move(bound));
    }
    auto bound_limit = stmt.bind_int64(2, static_cast<int64_t>(limit));
    if (bound_limit.is_err()) return propagate<R>(std::move(bound_limit));

    std::vector<Entity> rows;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) return propagate<R>(std::move(step_result));
        if (!step_result.unwrap()) break;
        rows.push_back(row_to_entity(collection, stmt));
    }
    return R::ok(std::move(rows));
}

Result<std::vector<Entity>> LocalStore::page(const std::string& collection,
                                             const std::optional<std::string>& after_id,
                                             size_t limit) {
    std::shared_lock lock(mutex_);
    return page_unlocked(collection, after_id, limit);
}

Result<std::optional<Entity>> LocalStore::get(const std::string& collection,
                                              const std::string& id,
                                              ReadOptions options) {
    std::shared_lock lock(mutex_);
    auto loaded = load_unlocked(EntityKey{collection, id});
    if (loaded.is_err()) return loaded;

    auto entity = std::move(loaded).unwrap();
    if (entity && entity->is_deleted && !options.include_tombstones) {
        return Result<std::optional<Entity>>::ok(std::nullopt);
    }
    return Result<std::optional<Entity>>::ok(std::move(entity));
}

Result<Entity> LocalStore::put(const std::string& collection,
                               const std::string& id,
                               const std::string& payload) {
    if (id.empty()) {
        return Result<Entity>::err(Error{ErrorKind::InvalidArgument, "Entity id must not be empty"});
    }

    return write([&](StoreTransaction& txn) -> Result<Entity> {
        auto loaded = txn.load(EntityKey{collection, id});
        if (loaded.is_err()) return propagate<Result<Entity>>(std::move(loaded));
        const auto existing = std::move(loaded).unwrap();

        // A tombstoned id comes back as a fresh create.
        const bool creating = !existing || existing->is_deleted;
        if (existing && existing->sync_state == SyncState::Conflicted) {
            auto settled = txn.settle_conflict(EntityKey{collection, id});
            if (settled.is_err()) return propagate<Result<Entity>>(std::move(settled));
        }

        Entity entity{
            .collection = collection,
            .id = id,
            .payload = payload,
            .revision = existing ? existing->revision + 1 : 1,
            .updated_at = clock_.now(),
            .is_deleted = false,
            .sync_state = SyncState::PendingPush
        };

        auto saved = txn.save(entity);
        if (saved.is_err()) return propagate<Result<Entity>>(std::move(saved));

        auto queued = txn.enqueue(creating ? Operation::Create : Operation::Update, entity);
        if (queued.is_err()) return propagate<Result<Entity>>(std::move(queued));

        return Result<Entity>::ok(std::move(entity));
    });
}

Result<void> LocalStore::remove(const std::string& collection, const std::string& id) {
    return write([&](StoreTransaction& txn) -> Result<void> {
        auto loaded = txn.load(EntityKey{collection, id});
        if (loaded.is_err()) return propagate<Result<void>>(std::move(loaded));

        auto existing = std::move(loaded).unwrap();
        if (!existing || existing->is_deleted) {
            return Result<void>::err(not_found(collection, id));
        }

        if (existing->sync_state == SyncState::Conflicted) {
            auto settled = txn.settle_conflict(EntityKey{collection, id});
            if (settled.is_err()) return settled;
        }

        Entity tombstone = std::move(*existing);
        tombstone.is_deleted = true;
        tombstone.revision += 1;
        tombstone.updated_at = clock_.now();
        tombstone.sync_state = SyncState::PendingPush;

        auto saved = txn.save(tombstone);
        if (saved.is_err()) return saved;

        auto queued = txn.enqueue(Operation::Delete, tombstone);
        if (queued.is_err()) return propagate<Result<void>>(std::move(queued));
        return Result<void>::ok();
    });
}

EntitySequence LocalStore::list(const std::string& collection,
                                EntityPredicate predicate,
                                ReadOptions options,
                                size_t page_size) {
    return EntitySequence(*this, collection, std::move(predicate), options, page_size);
}

Result<std::vector<Entity>> LocalStore::conflicted(const std::string& collection) {
    return list(collection,
                [](const Entity& e) { return e.sync_state == SyncState::Conflicted; },
                ReadOptions{.include_tombstones = true})
        .collect();
}

Result<std::optional<ConflictSnapshot>> LocalStore::conflict_snapshot(const std::string& collection,
                                                                     const std::string& id) {
    using R = Result<std::optional<ConflictSnapshot>>;
    std::shared_lock lock(mutex_);

    auto stmt_result = db_.prepare(R"SQL(
        SELECT payload, revision, updated_at, is_deleted, reason, recorded_at
        FROM conflict_snapshots WHERE collection = ? AND entity_id = ?;
    )SQL");
    if (stmt_result.is_err()) return propagate<R>(std::move(stmt_result));

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, collection).and_then([&] { return stmt.bind_text(2, id); });
    if (bound.is_err()) return propagate<R>(std::move(bound));

    auto row = stmt.step();
    if (row.is_err()) return propagate<R>(std::move(row));
    if (!row.unwrap()) return R::ok(std::nullopt);

    return R::ok(ConflictSnapshot{
        .remote = Entity{
            .collection = collection,
            .id = id,
            .payload = stmt.column_text(0),
            .revision = stmt.column_int64(1),
            .updated_at = Timestamp(stmt.column_int64(2)),
            .is_deleted = stmt.column_int(3) != 0,
            .sync_state = SyncState::Clean
        },
        .reason = stmt.column_text(4),
        .recorded_at = Timestamp(stmt.column_int64(5))
    });
}

Result<Entity> LocalStore::resolve_conflict(const std::string& collection,
                                            const std::string& id,
                                            const std::string& payload) {
    return write([&](StoreTransaction& txn) -> Result<Entity> {
        auto loaded = txn.load(EntityKey{collection, id});
        if (loaded.is_err()) return propagate<Result<Entity>>(std::move(loaded));

        auto existing = std::move(loaded).unwrap();
        if (!existing) return Result<Entity>::err(not_found(collection, id));
        if (existing->sync_state != SyncState::Conflicted) {
            return Result<Entity>::err(Error{ErrorKind::InvalidArgument,
                                             collection + "/" + id + " is not conflicted"});
        }

        auto settled = txn.settle_conflict(EntityKey{collection, id});
        if (settled.is_err()) return propagate<Result<Entity>>(std::move(settled));

        Entity entity = std::move(*existing);
        const bool was_deleted = entity.is_deleted;
        entity.payload = payload;
        entity.is_deleted = false;
        entity.revision += 1;
        entity.updated_at = clock_.now();
        entity.sync_state = SyncState::PendingPush;

        auto saved = txn.save(entity);
        if (saved.is_err()) return propagate<Result<Entity>>(std::move(saved));

        auto queued = txn.enqueue(was_deleted ? Operation::Create : Operation::Update, entity);
        if (queued.is_err()) return propagate<Result<Entity>>(std::move(queued));
        return Result<Entity>::ok(std::move(entity));
    });
}

Result<Entity> LocalStore::apply_remote(const std::string& collection,
                                        const std::string& id,
                                        const Entity& remote) {
    Entity entity = remote;
    entity.collection = collection;
    entity.id = id;
    return write([&](StoreTransaction& txn) { return txn.apply_remote(entity); });
}

Result<std::optional<Entity>> LocalStore::confirm_push(const QueueItem& item, int64_t server_revision) {
    using R = Result<std::optional<Entity>>;

    return write([&](StoreTransaction& txn) -> R {
        auto acked = txn.queue().ack(item.sequence);
        if (acked.is_err()) return propagate<R>(std::move(acked));

        auto remaining = txn.queue().pending_for(item.key());
        if (remaining.is_err()) return propagate<R>(std::move(remaining));
        const bool settled = remaining.unwrap().empty();

        auto loaded = txn.load(item.key());
        if (loaded.is_err()) return propagate<R>(std::move(loaded));
        auto entity = std::move(loaded).unwrap();
        if (!entity) return R::ok(std::nullopt);

        if (item.operation == Operation::Delete && settled && entity->is_deleted) {
            auto purged = txn.purge(item.key());
            if (purged.is_err()) return propagate<R>(std::move(purged));
            return R::ok(std::nullopt);
        }

        entity->revision = std::max(entity->revision, server_revision);
        if (settled && entity->sync_state == SyncState::PendingPush) {
            entity->revision = server_revision;
            entity->sync_state = SyncState::Clean;
        }
        auto saved = txn.save(*entity);
        if (saved.is_err()) return propagate<R>(std::move(saved));
        return R::ok(std::move(entity));
    });
}

Result<FailOutcome> LocalStore::record_push_failure(const QueueItem& item,
                                                    const std::string& error,
                                                    bool permanent) {
    return write([&](StoreTransaction& txn) {
        return txn.queue().fail(item.sequence, error, permanent);
    });
}

Result<std::optional<std::string>> LocalStore::cursor(const std::string& collection) {
    using R = Result<std::optional<std::string>>;
    std::shared_lock lock(mutex_);

    auto stmt_result = db_.prepare("SELECT cursor FROM sync_cursors WHERE collection = ?;");
    if (stmt_result.is_err()) return propagate<R>(std::move(stmt_result));

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, collection);
    if (bound.is_err()) return propagate<R>(std::move(bound));

    auto row = stmt.step();
    if (row.is_err()) return propagate<R>(std::move(row));
    if (!row.unwrap()) return R::ok(std::nullopt);
    return R::ok(stmt.column_text(0));
}

} // namespace tidemark::storage
