#pragma once

#include "core/entity.hpp"
#include "core/queue_item.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/database.hpp"
#include "storage/sync_queue.hpp"
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace tidemark::storage {

struct ReadOptions {
    bool include_tombstones = false;
};

using EntityPredicate = std::function<bool(const Entity&)>;

// last_error of queue items parked while their entity is Conflicted.
inline constexpr const char* kParkedForConflict = "awaiting conflict resolution";

/**
 * ConflictSnapshot - Server value a Conflicted entity could not be reconciled
 * with, kept until the conflict is settled.
 */
struct ConflictSnapshot {
    Entity remote;
    std::string reason;
    Timestamp recorded_at;
};

class LocalStore;

/**
 * EntitySequence - Lazily reads a collection in id order.
 *
 * Rows are fetched a page at a time, each page under a fresh read. Nothing
 * stays open between next() calls, so a sequence sees writes made after it
 * was created once it reaches their ids. restart() begins again from the
 * first id.
 */
class EntitySequence {
public:
    /**
     * Next matching entity, or nullopt at the end.
     */
    [[nodiscard]] Result<std::optional<Entity>> next();

    void restart();

    /**
     * Drain the rest of the sequence into a vector.
     */
    [[nodiscard]] Result<std::vector<Entity>> collect();

private:
    friend class LocalStore;

    EntitySequence(LocalStore& store,
                   std::string collection,
                   EntityPredicate predicate,
                   ReadOptions options,
                   size_t page_size);

    [[nodiscard]] Result<void> fill();

    LocalStore* store_;
    std::string collection_;
    EntityPredicate predicate_;
    ReadOptions options_;
    size_t page_size_;
    std::optional<std::string> after_id_;
    std::deque<Entity> buffer_;
    bool exhausted_ = false;
};

/**
 * StoreTransaction - Unit of work handed out by LocalStore::write().
 *
 * Only valid inside the callback; every call joins the enclosing SQLite
 * transaction and runs under the store's exclusive lock.
 */
class StoreTransaction {
public:
    /**
     * Entity including tombstones.
     */
    [[nodiscard]] Result<std::optional<Entity>> load(const EntityKey& key);

    [[nodiscard]] Result<void> save(const Entity& entity);

    /**
     * Physically remove the row.
     */
    [[nodiscard]] Result<void> purge(const EntityKey& key);

    /**
     * Append a QueueItem mirroring `entity`.
     */
    [[nodiscard]] Result<int64_t> enqueue(Operation op, const Entity& entity);

    [[nodiscard]] Result<void> set_cursor(const std::string& collection, const std::string& cursor);

    /**
     * Take a server value as-is: saved Clean, or purged if it is a tombstone.
     * Settles any open conflict on the key.
     */
    [[nodiscard]] Result<Entity> apply_remote(const Entity& remote);

    /**
     * Leave `local` for the application. Marks it Conflicted, parks its live
     * queue items and records `remote` as its snapshot.
     */
    [[nodiscard]] Result<void> mark_conflicted(const Entity& local,
                                               const Entity& remote,
                                               const std::string& reason);

    /**
     * Forget the snapshot and the parked items of a conflict on `key`.
     */
    [[nodiscard]] Result<void> settle_conflict(const EntityKey& key);

    [[nodiscard]] SyncQueue& queue();

private:
    friend class LocalStore;
    explicit StoreTransaction(LocalStore& store) : store_(store) {}

    LocalStore& store_;
};

/**
 * LocalStore - The only component that reads or writes persisted entities.
 *
 * Writers (application mutations and sync commits) are serialized by an
 * exclusive lock and each runs as one SQLite transaction. Every application
 * mutation appends its QueueItem in that same transaction, so an entity
 * change is never visible without the item that will push it.
 */
class LocalStore {
public:
    LocalStore(Database& db, SyncQueue& queue, const Clock& clock);

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    /**
     * Read the collection registry. Call after migrations ran.
     */
    [[nodiscard]] Result<void> load_registry();

    [[nodiscard]] std::vector<std::string> collections() const;
    [[nodiscard]] Result<RevisionScheme> revision_scheme(const std::string& collection) const;

    // ---- application API ---------------------------------------------------

    [[nodiscard]] Result<std::optional<Entity>> get(const std::string& collection,
                                                    const std::string& id,
                                                    ReadOptions options = {});

    /**
     * Create or update. Bumps revision, marks PendingPush and enqueues a
     * Create/Update item.
     */
    [[nodiscard]] Result<Entity> put(const std::string& collection,
                                     const std::string& id,
                                     const std::string& payload);

    /**
     * Tombstone the entity and enqueue a Delete item.
     */
    [[nodiscard]] Result<void> remove(const std::string& collection, const std::string& id);

    [[nodiscard]] EntitySequence list(const std::string& collection,
                                      EntityPredicate predicate = {},
                                      ReadOptions options = {},
                                      size_t page_size = 100);

    /**
     * Entities waiting for an application decision.
     */
    [[nodiscard]] Result<std::vector<Entity>> conflicted(const std::string& collection);

    /**
     * Server side of a conflict on collection/id, if one is open.
     */
    [[nodiscard]] Result<std::optional<ConflictSnapshot>> conflict_snapshot(const std::string& collection,
                                                                            const std::string& id);

    /**
     * Settle a Conflicted entity with the application's payload; behaves
     * like put() afterwards. Items parked by the conflict are discarded.
     */
    [[nodiscard]] Result<Entity> resolve_conflict(const std::string& collection,
                                                  const std::string& id,
                                                  const std::string& payload);

    // ---- sync API ----------------------------------------------------------

    /**
     * Overwrite local state with a server-confirmed entity and mark it Clean.
     * A remote tombstone purges the row.
     */
    [[nodiscard]] Result<Entity> apply_remote(const std::string& collection,
                                              const std::string& id,
                                              const Entity& remote);

    /**
     * Ack `item` and update its entity: adopt the server revision, mark Clean
     * once nothing else is queued for it, purge a confirmed tombstone.
     */
    [[nodiscard]] Result<std::optional<Entity>> confirm_push(const QueueItem& item,
                                                             int64_t server_revision);

    [[nodiscard]] Result<FailOutcome> record_push_failure(const QueueItem& item,
                                                          const std::string& error,
                                                          bool permanent);

    [[nodiscard]] Result<std::optional<std::string>> cursor(const std::string& collection);

    /**
     * Run `f(StoreTransaction&)` under the exclusive lock inside one
     * transaction. `f` must return a Result; Err rolls everything back.
     */
    template<typename F>
    [[nodiscard]] auto write(F&& f) -> decltype(f(std::declval<StoreTransaction&>())) {
        std::unique_lock lock(mutex_);
        StoreTransaction txn(*this);
        return db_.transaction([&] { return f(txn); });
    }

    [[nodiscard]] SyncQueue& queue() { return queue_; }

    /**
     * Run `f()` under the shared lock, for reads that bypass the store API.
     */
    template<typename F>
    [[nodiscard]] auto read(F&& f) -> decltype(f()) {
        std::shared_lock lock(mutex_);
        return f();
    }

    /**
     * Shared (read) access to the queue for callers outside write().
     */
    template<typename F>
    [[nodiscard]] auto read_queue(F&& f) -> decltype(f(std::declval<SyncQueue&>())) {
        std::shared_lock lock(mutex_);
        return f(queue_);
    }

private:
    friend class EntitySequence;
    friend class StoreTransaction;

    struct CollectionInfo {
        std::string table;
        RevisionScheme scheme = RevisionScheme::Timestamp;
    };

    Database& db_;
    SyncQueue& queue_;
    const Clock& clock_;
    mutable std::shared_mutex mutex_;
    mutable std::shared_mutex registry_mutex_;
    std::map<std::string, CollectionInfo> registry_;

    [[nodiscard]] Result<std::string> table_for(const std::string& collection) const;

    [[nodiscard]] Result<std::optional<Entity>> load_unlocked(const EntityKey& key);
    [[nodiscard]] Result<void> save_unlocked(const Entity& entity);
    [[nodiscard]] Result<void> purge_unlocked(const EntityKey& key);
    [[nodiscard]] Result<std::vector<Entity>> page_unlocked(const std::string& collection,
                                                            const std::optional<std::string>& after_id,
                                                            size_t limit);
    [[nodiscard]] Result<std::vector<Entity>> page(const std::string& collection,
                                                   const std::optional<std::string>& after_id,
                                                   size_t limit);

    [[nodiscard]] Entity row_to_entity(const std::string& collection, Statement& stmt) const;
};

} // namespace tidemark::storage
