#pragma once

#include "core/conflict_resolver.hpp"
#include "core/entity.hpp"
#include "core/queue_item.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/engine_config.hpp"
#include "storage/database.hpp"
#include "storage/local_store.hpp"
#include "storage/migrations.hpp"
#include "storage/sync_queue.hpp"
#include "sync/remote_api.hpp"
#include "sync/sync_coordinator.hpp"
#include <QThread>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tidemark::engine {

/**
 * OpenError - Why an engine could not be opened. The store must not be used.
 */
struct OpenError {
    enum class Kind {
        Config,
        Storage,
        Migration
    };

    Kind kind = Kind::Storage;
    std::string message;
    std::optional<storage::MigrationError> migration;
};

/**
 * OfflineEngine - One store plus everything that syncs it.
 *
 * Created by open(), which migrates the store before anything else can reach
 * it. Without a RemoteApi the engine works fully offline and trigger_sync()
 * reports an error.
 *
 * The coordinator lives on a worker thread owned by the engine. Timer,
 * connectivity and request_sync() runs execute there; trigger_sync() runs on
 * the caller's thread and blocks it.
 */
class OfflineEngine {
public:
    [[nodiscard]] static Result<std::unique_ptr<OfflineEngine>, OpenError> open(
        EngineConfig config,
        sync::RemoteApi* remote = nullptr,
        const Clock* clock = nullptr);

    OfflineEngine(const OfflineEngine&) = delete;
    OfflineEngine& operator=(const OfflineEngine&) = delete;
    ~OfflineEngine();

    // Application API
    [[nodiscard]] Result<Entity> put(const std::string& collection,
                                     const std::string& id,
                                     const std::string& payload);
    [[nodiscard]] Result<std::optional<Entity>> get(const std::string& collection,
                                                    const std::string& id,
                                                    storage::ReadOptions options = {});
    [[nodiscard]] Result<void> remove(const std::string& collection, const std::string& id);
    [[nodiscard]] storage::EntitySequence list(const std::string& collection,
                                               storage::EntityPredicate predicate = {},
                                               storage::ReadOptions options = {});

    [[nodiscard]] Result<std::vector<Entity>> conflicted(const std::string& collection);
    [[nodiscard]] Result<Entity> resolve_conflict(const std::string& collection,
                                                  const std::string& id,
                                                  const std::string& payload);
    [[nodiscard]] Result<std::optional<storage::ConflictSnapshot>> conflict_snapshot(
        const std::string& collection,
        const std::string& id);

    // Sync
    [[nodiscard]] Result<sync::SyncReport> trigger_sync(
        sync::SyncTrigger trigger = sync::SyncTrigger::Manual);
    [[nodiscard]] Result<void> request_sync(sync::SyncTrigger trigger = sync::SyncTrigger::Manual);
    void cancel_sync();
    void on_connectivity_changed(bool online);

    /**
     * Coordinator for signal subscriptions; nullptr without a RemoteApi.
     */
    [[nodiscard]] sync::SyncCoordinator* coordinator() { return coordinator_; }

    // Queue
    [[nodiscard]] Result<std::vector<QueueItem>> dead_letters();
    [[nodiscard]] Result<void> requeue_dead_letter(int64_t sequence);
    [[nodiscard]] Result<void> discard_dead_letter(int64_t sequence);
    [[nodiscard]] Result<std::vector<QueueItem>> pending_items(size_t max = 100);
    [[nodiscard]] Result<QueueStats> queue_stats();

    // Schema
    [[nodiscard]] Result<storage::MigrationStatus, storage::MigrationError> migration_status();
    [[nodiscard]] std::vector<std::string> collections() const;

    [[nodiscard]] const EngineConfig& config() const { return config_; }
    [[nodiscard]] const ConflictResolver& resolver() const { return resolver_; }

private:
    OfflineEngine(EngineConfig config, storage::Database db, const Clock* clock);

    [[nodiscard]] Result<void> configure_collections();

    EngineConfig config_;
    SystemClock system_clock_;
    const Clock& clock_;
    storage::Database db_;
    storage::SyncQueue queue_;
    storage::LocalStore store_;
    ConflictResolver resolver_;
    std::unique_ptr<QThread> sync_thread_;
    // Lives on sync_thread_ and is deleted there when the thread finishes.
    sync::SyncCoordinator* coordinator_ = nullptr;
};

} // namespace tidemark::engine
