#include "engine/offline_engine.hpp"

#include "sync/field_merge.hpp"
#include <QDebug>
#include <QString>
#include <algorithm>

namespace tidemark::engine {

namespace {

OpenError open_error(OpenError::Kind kind, std::string message) {
    return OpenError{.kind = kind, .message = std::move(message), .migration = std::nullopt};
}

Error no_remote() {
    return Error{ErrorKind::InvalidArgument, "No remote API attached; engine is offline-only"};
}

} // namespace

Result<std::unique_ptr<OfflineEngine>, OpenError> OfflineEngine::open(EngineConfig config,
                                                                      sync::RemoteApi* remote,
                                                                      const Clock* clock) {
    using R = Result<std::unique_ptr<OfflineEngine>, OpenError>;

    auto valid = config.validate();
    if (valid.is_err()) {
        return R::err(open_error(OpenError::Kind::Config, valid.unwrap_err().message));
    }

    auto db_result = storage::Database::open(config.database_path);
    if (db_result.is_err()) {
        return R::err(open_error(OpenError::Kind::Storage,
                                 "Cannot open " + config.database_path + ": " +
                                     db_result.unwrap_err().message));
    }
    auto db = std::move(db_result).unwrap();

    // Nothing else can reach the store until this returns.
    storage::MigrationManager migrations(db, storage::builtin_migrations(), clock);
    const int target = config.target_schema_version.value_or(migrations.latest_version());
    auto migrated = migrations.initialize(target);
    if (migrated.is_err()) {
        const auto& error = migrated.unwrap_err();
        qWarning() << "OfflineEngine: migration failed:" << QString::fromStdString(describe(error));
        return R::err(OpenError{.kind = OpenError::Kind::Migration,
                                .message = describe(error),
                                .migration = error});
    }
    for (int version : migrated.unwrap()) {
        qInfo() << "OfflineEngine: applied migration" << version;
    }

    std::unique_ptr<OfflineEngine> engine(new OfflineEngine(std::move(config), std::move(db), clock));

    auto registry = engine->store_.load_registry();
    if (registry.is_err()) {
        return R::err(open_error(OpenError::Kind::Storage, registry.unwrap_err().message));
    }

    auto configured = engine->configure_collections();
    if (configured.is_err()) {
        return R::err(open_error(OpenError::Kind::Config, configured.unwrap_err().message));
    }

    if (remote) {
        engine->sync_thread_ = std::make_unique<QThread>();
        engine->sync_thread_->setObjectName(QStringLiteral("tidemark-sync"));

        engine->coordinator_ = new sync::SyncCoordinator(
            engine->store_, engine->resolver_, *remote, engine->clock_,
            sync::SyncOptions{.drain_batch_size = engine->config_.drain_batch_size,
                              .collections = {}});
        engine->coordinator_->moveToThread(engine->sync_thread_.get());
        QObject::connect(engine->sync_thread_.get(), &QThread::finished,
                         engine->coordinator_, &QObject::deleteLater);
        engine->sync_thread_->start();

        engine->coordinator_->set_periodic_interval(engine->config_.periodic_sync_interval);
    }

    qInfo() << "OfflineEngine: opened" << QString::fromStdString(engine->config_.database_path)
            << "at schema version" << target;
    return R::ok(std::move(engine));
}

OfflineEngine::OfflineEngine(EngineConfig config, storage::Database db, const Clock* clock)
    : config_(std::move(config))
    , clock_(clock ? *clock : system_clock_)
    , db_(std::move(db))
    , queue_(db_, config_.retry, clock_)
    , store_(db_, queue_, clock_)
    , resolver_(CollectionPolicy{.strategy = config_.default_strategy,
                                 .revision_scheme = RevisionScheme::Timestamp,
                                 .merge = {}})
{}

OfflineEngine::~OfflineEngine() {
    if (!sync_thread_) return;

    // The coordinator holds references into the store; it must be gone first.
    coordinator_->cancel();
    sync_thread_->quit();
    sync_thread_->wait();
    coordinator_ = nullptr;
}

Result<void> OfflineEngine::configure_collections() {
    const auto registered = store_.collections();

    for (const auto& [name, configured] : config_.collections) {
        if (std::find(registered.begin(), registered.end(), name) == registered.end()) {
            qWarning() << "OfflineEngine: configuration names unknown collection"
                       << QString::fromStdString(name);
        }
    }

    for (const auto& name : registered) {
        auto scheme = store_.revision_scheme(name);
        if (scheme.is_err()) return propagate<Result<void>>(std::move(scheme));

        CollectionPolicy policy{
            .strategy = config_.default_strategy,
            .revision_scheme = scheme.unwrap(),
            .merge = {}
        };

        auto it = config_.collections.find(name);
        if (it != config_.collections.end()) {
            const auto& configured = it->second;
            if (configured.revision_scheme && *configured.revision_scheme != policy.revision_scheme) {
                return Result<void>::err(Error{
                    ErrorKind::InvalidArgument,
                    "Collection " + name + " is stored with revision scheme " +
                        std::string(to_string(policy.revision_scheme)) + ", configuration says " +
                        std::string(to_string(*configured.revision_scheme))});
            }
            policy.strategy = configured.strategy;
            if (configured.merge) {
                policy.merge = configured.merge;
            } else if (!configured.local_fields.empty()) {
                policy.merge = sync::json_field_merge(configured.local_fields);
            }
        }

        resolver_.set_policy(name, std::move(policy));
    }
    return Result<void>::ok();
}

Result<Entity> OfflineEngine::put(const std::string& collection,
                                  const std::string& id,
                                  const std::string& payload) {
    return store_.put(collection, id, payload);
}

Result<std::optional<Entity>> OfflineEngine::get(const std::string& collection,
                                                 const std::string& id,
                                                 storage::ReadOptions options) {
    return store_.get(collection, id, options);
}

Result<void> OfflineEngine::remove(const std::string& collection, const std::string& id) {
    return store_.remove(collection, id);
}

storage::EntitySequence OfflineEngine::list(const std::string& collection,
                                            storage::EntityPredicate predicate,
                                            storage::ReadOptions options) {
    return store_.list(collection, std::move(predicate), options);
}

Result<std::vector<Entity>> OfflineEngine::conflicted(const std::string& collection) {
    return store_.conflicted(collection);
}

Result<Entity> OfflineEngine::resolve_conflict(const std::string& collection,
                                               const std::string& id,
                                               const std::string& payload) {
    return store_.resolve_conflict(collection, id, payload);
}

Result<std::optional<storage::ConflictSnapshot>> OfflineEngine::conflict_snapshot(
    const std::string& collection,
    const std::string& id) {
    return store_.conflict_snapshot(collection, id);
}

Result<sync::SyncReport> OfflineEngine::trigger_sync(sync::SyncTrigger trigger) {
    if (!coordinator_) return Result<sync::SyncReport>::err(no_remote());
    return Result<sync::SyncReport>::ok(coordinator_->trigger_sync(trigger));
}

Result<void> OfflineEngine::request_sync(sync::SyncTrigger trigger) {
    if (!coordinator_) return Result<void>::err(no_remote());
    coordinator_->request_sync(trigger);
    return Result<void>::ok();
}

void OfflineEngine::cancel_sync() {
    if (coordinator_) coordinator_->cancel();
}

void OfflineEngine::on_connectivity_changed(bool online) {
    if (coordinator_) coordinator_->on_connectivity_changed(online);
}

Result<std::vector<QueueItem>> OfflineEngine::dead_letters() {
    return store_.read_queue([](storage::SyncQueue& queue) { return queue.dead_letters(); });
}

Result<void> OfflineEngine::requeue_dead_letter(int64_t sequence) {
    return store_.write([&](storage::StoreTransaction& txn) {
        return txn.queue().requeue_dead_letter(sequence);
    });
}

Result<void> OfflineEngine::discard_dead_letter(int64_t sequence) {
    return store_.write([&](storage::StoreTransaction& txn) {
        return txn.queue().discard_dead_letter(sequence);
    });
}

Result<std::vector<QueueItem>> OfflineEngine::pending_items(size_t max) {
    return store_.read_queue([&](storage::SyncQueue& queue) { return queue.peek_batch(max); });
}

Result<QueueStats> OfflineEngine::queue_stats() {
    return store_.read_queue([](storage::SyncQueue& queue) { return queue.stats(); });
}

Result<storage::MigrationStatus, storage::MigrationError> OfflineEngine::migration_status() {
    return store_.read([&] {
        storage::MigrationManager migrations(db_, storage::builtin_migrations(), &clock_);
        return migrations.status();
    });
}

std::vector<std::string> OfflineEngine::collections() const {
    return store_.collections();
}

} // namespace tidemark::engine
