#include "sync/sync_coordinator.hpp"

#include <QDebug>
#include <QMetaObject>
#include <QThread>
#include <set>
#include <utility>

namespace tidemark::sync {

namespace {

constexpr const char* kSupersededByRemote = "superseded by remote";

QString qstr(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

QString describe(const EntityKey& key) {
    return qstr(key.collection) + QLatin1Char('/') + qstr(key.id);
}

enum class Action {
    Skip,            // Nothing local and the server only reports a deletion
    Stale,           // Server value is not newer than the clean local one
    ApplyRemote,     // No local edits; take the server value
    Resolved,        // Local edits met a server change; resolver decided
    MarkConflicted   // Resolver could not decide
};

struct Decision {
    Action action = Action::Skip;
    std::optional<ConflictRecord> record;
    std::string reason;
};

struct CommitCounts {
    int stale_skipped = 0;
    int conflicts = 0;
    int conflicted = 0;
    int committed = 0;
};

bool is_stale(RevisionScheme scheme, const Entity& local, const Entity& remote) {
    if (scheme == RevisionScheme::ServerCounter) {
        return remote.revision <= local.revision;
    }
    return remote.updated_at < local.updated_at;
}

Decision decide(const ConflictResolver& resolver,
                RevisionScheme scheme,
                const std::optional<Entity>& local,
                const Entity& remote) {
    if (!local) {
        return Decision{.action = remote.is_deleted ? Action::Skip : Action::ApplyRemote};
    }

    if (local->sync_state == SyncState::Clean) {
        // A server deletion always applies.
        if (!remote.is_deleted && is_stale(scheme, *local, remote)) {
            return Decision{.action = Action::Stale};
        }
        return Decision{.action = Action::ApplyRemote};
    }

    auto resolved = resolver.resolve(*local, remote);
    if (resolved.is_err()) {
        return Decision{.action = Action::MarkConflicted, .reason = resolved.unwrap_err().message};
    }
    return Decision{.action = Action::Resolved, .record = std::move(resolved).unwrap()};
}

// Pending pushes of a local value the server has overruled are parked, not dropped.
Result<void> supersede_pending(storage::StoreTransaction& txn, const EntityKey& key) {
    auto pending = txn.queue().pending_for(key);
    if (pending.is_err()) return propagate<Result<void>>(std::move(pending));

    for (const auto& item : pending.unwrap()) {
        auto parked = txn.queue().dead_letter(item.sequence, kSupersededByRemote);
        if (parked.is_err()) return parked;
    }
    return Result<void>::ok();
}

Result<void> keep_local_value(storage::StoreTransaction& txn, const ConflictRecord& record) {
    const Entity& resolved = record.resolved;
    auto saved = txn.save(resolved);
    if (saved.is_err()) return saved;

    auto pending = txn.queue().pending_for(key_of(resolved));
    if (pending.is_err()) return propagate<Result<void>>(std::move(pending));

    // Queued items already carry the local value; a merged value is new.
    if (record.resolution != Resolution::Merged && !pending.unwrap().empty()) {
        return Result<void>::ok();
    }

    Operation op = Operation::Update;
    if (resolved.is_deleted) {
        op = Operation::Delete;
    } else if (record.remote.is_deleted) {
        op = Operation::Create;
    }
    auto queued = txn.enqueue(op, resolved);
    if (queued.is_err()) return propagate<Result<void>>(std::move(queued));
    return Result<void>::ok();
}

/**
 * Carry out one decision. Ok(true) when the entity changed.
 */
Result<bool> apply_decision(storage::StoreTransaction& txn,
                            const Decision& decision,
                            const std::optional<Entity>& local,
                            const Entity& remote,
                            CommitCounts& counts) {
    switch (decision.action) {
        case Action::Skip:
            return Result<bool>::ok(false);

        case Action::Stale:
            ++counts.stale_skipped;
            return Result<bool>::ok(false);

        case Action::ApplyRemote: {
            auto applied = txn.apply_remote(remote);
            if (applied.is_err()) return propagate<Result<bool>>(std::move(applied));
            return Result<bool>::ok(true);
        }

        case Action::MarkConflicted: {
            ++counts.conflicts;
            ++counts.conflicted;
            auto marked = txn.mark_conflicted(*local, remote, decision.reason);
            if (marked.is_err()) return propagate<Result<bool>>(std::move(marked));
            return Result<bool>::ok(true);
        }

        case Action::Resolved:
            break;
    }

    ++counts.conflicts;
    const auto& record = *decision.record;
    if (record.needs_push()) {
        // A resolved value replaces whatever an earlier conflict parked.
        if (local->sync_state == SyncState::Conflicted) {
            auto settled = txn.settle_conflict(key_of(remote));
            if (settled.is_err()) return propagate<Result<bool>>(std::move(settled));
        }

        auto kept = keep_local_value(txn, record);
        if (kept.is_err()) return propagate<Result<bool>>(std::move(kept));
        return Result<bool>::ok(true);
    }

    auto superseded = supersede_pending(txn, key_of(remote));
    if (superseded.is_err()) return propagate<Result<bool>>(std::move(superseded));
    auto applied = txn.apply_remote(record.resolved);
    if (applied.is_err()) return propagate<Result<bool>>(std::move(applied));
    return Result<bool>::ok(true);
}

} // namespace

struct SyncCoordinator::PlannedChange {
    Entity remote;
    std::optional<Entity> local;
    Decision decision;
};

struct SyncCoordinator::PulledCollection {
    std::string collection;
    RevisionScheme scheme = RevisionScheme::Timestamp;
    std::string next_cursor;
    std::vector<PlannedChange> changes;
};

SyncCoordinator::SyncCoordinator(storage::LocalStore& store,
                                 const ConflictResolver& resolver,
                                 RemoteApi& remote,
                                 const Clock& clock,
                                 SyncOptions options,
                                 QObject* parent)
    : QObject(parent)
    , store_(store)
    , resolver_(resolver)
    , remote_(remote)
    , clock_(clock)
    , options_(std::move(options))
    , timer_(new QTimer(this))
{
    qRegisterMetaType<tidemark::sync::SyncPhase>();
    qRegisterMetaType<tidemark::sync::SyncReport>();

    if (options_.drain_batch_size == 0) options_.drain_batch_size = 1;

    connect(timer_, &QTimer::timeout, this, [this]() {
        trigger_sync(SyncTrigger::Timer);
    });
}

SyncCoordinator::~SyncCoordinator() {
    timer_->stop();
    cancel();
}

bool SyncCoordinator::is_running() const {
    std::lock_guard lock(run_mutex_);
    return running_;
}

void SyncCoordinator::cancel() {
    cancel_requested_ = true;
}

void SyncCoordinator::set_periodic_interval(std::chrono::milliseconds interval) {
    // The timer belongs to the coordinator's thread.
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this, interval]() {
            set_periodic_interval(interval);
        }, Qt::QueuedConnection);
        return;
    }

    if (interval.count() <= 0) {
        timer_->stop();
        return;
    }
    timer_->start(interval);
}

void SyncCoordinator::on_connectivity_changed(bool online) {
    bool was_online = false;
    {
        std::lock_guard lock(run_mutex_);
        was_online = online_;
        online_ = online;
    }
    if (online && !was_online) {
        qInfo() << "SyncCoordinator: connectivity restored";
        request_sync(SyncTrigger::Connectivity);
    } else if (!online && was_online) {
        qInfo() << "SyncCoordinator: connectivity lost";
    }
}

void SyncCoordinator::request_sync(SyncTrigger trigger) {
    {
        std::lock_guard lock(run_mutex_);
        if (running_) {
            rerun_requested_ = true;
            qDebug() << "SyncCoordinator:" << qstr(to_string(trigger))
                     << "request folded into active run";
            return;
        }
    }

    QMetaObject::invokeMethod(this, [this, trigger]() {
        trigger_sync(trigger);
    }, Qt::QueuedConnection);
}

SyncReport SyncCoordinator::trigger_sync(SyncTrigger trigger) {
    SyncReport report;
    report.trigger = trigger;

    {
        std::lock_guard lock(run_mutex_);
        if (running_) {
            rerun_requested_ = true;
            report.coalesced = true;
            report.final_phase = phase_.load();
            qDebug() << "SyncCoordinator:" << qstr(to_string(trigger))
                     << "trigger folded into active run";
            return report;
        }
        running_ = true;
        rerun_requested_ = false;
    }
    cancel_requested_ = false;

    qInfo() << "SyncCoordinator: run started by" << qstr(to_string(trigger));

    while (true) {
        run_once(report);

        std::lock_guard lock(run_mutex_);
        if (rerun_requested_ && report.cancelled) {
            qDebug() << "SyncCoordinator: dropping queued rerun after cancellation";
        } else if (rerun_requested_ && !report.ok()) {
            qDebug() << "SyncCoordinator: rerunning after failed run";
        }
        if (!rerun_requested_ || report.cancelled) {
            rerun_requested_ = false;
            running_ = false;
            break;
        }
        rerun_requested_ = false;
    }

    qInfo() << "SyncCoordinator: run finished"
            << "phase=" << qstr(to_string(report.final_phase))
            << "runs=" << report.runs
            << "pushed=" << report.pushed
            << "failures=" << report.push_failures
            << "dead_lettered=" << report.dead_lettered
            << "pulled=" << report.pulled
            << "conflicts=" << report.conflicts
            << "committed=" << report.committed;

    emit syncFinished(report);
    return report;
}

void SyncCoordinator::set_phase(SyncPhase phase) {
    if (phase_.exchange(phase) == phase) return;
    emit stateChanged(phase);
}

bool SyncCoordinator::cancelled(SyncReport& report) const {
    if (!cancel_requested_) return false;
    report.cancelled = true;
    qInfo() << "SyncCoordinator: run cancelled";
    return true;
}

void SyncCoordinator::fail_run(SyncReport& report, const std::string& message) {
    report.error = message;
    report.final_phase = SyncPhase::Failed;
    qWarning() << "SyncCoordinator: sync failed, will retry:" << qstr(message);

    set_phase(SyncPhase::Failed);
    emit syncFailed(qstr(message));
    set_phase(SyncPhase::Idle);
}

void SyncCoordinator::run_once(SyncReport& report) {
    ++report.runs;
    report.final_phase = SyncPhase::Idle;
    // The report describes how the last run ended; counters add up across runs.
    report.error.reset();

    set_phase(SyncPhase::Draining);
    if (!drain(report) || report.cancelled) {
        if (report.cancelled) set_phase(SyncPhase::Idle);
        return;
    }

    set_phase(SyncPhase::Pulling);
    std::vector<PulledCollection> pulled;
    if (!pull(report, pulled) || report.cancelled) {
        if (report.cancelled) set_phase(SyncPhase::Idle);
        return;
    }

    set_phase(SyncPhase::Resolving);
    if (!plan(report, pulled)) return;

    set_phase(SyncPhase::Committing);
    auto committed = commit(pulled, report);
    if (committed.is_err()) {
        fail_run(report, "Commit failed: " + committed.unwrap_err().message);
        return;
    }

    for (const auto& key : committed.unwrap()) {
        emit entityCommitted(qstr(key.collection), qstr(key.id));
    }
    set_phase(SyncPhase::Idle);
}

bool SyncCoordinator::drain(SyncReport& report) {
    while (true) {
        auto ready = store_.read_queue([&](storage::SyncQueue& queue) {
            return queue.ready_batch(options_.drain_batch_size, clock_.now());
        });
        if (ready.is_err()) {
            fail_run(report, "Reading sync queue failed: " + ready.unwrap_err().message);
            return false;
        }

        const auto batch = std::move(ready).unwrap();
        if (batch.empty()) return true;

        bool progressed = false;
        // Keys with a failure in this batch; their later items wait.
        std::set<EntityKey> blocked;

        for (const auto& item : batch) {
            if (cancelled(report)) return true;
            if (blocked.contains(item.key())) continue;

            auto pushed = remote_.push(PushRequest{
                .sequence = item.sequence,
                .collection = item.collection,
                .id = item.id,
                .operation = item.operation,
                .payload = item.payload
            });

            if (pushed.is_ok()) {
                auto confirmed = store_.confirm_push(item, pushed.unwrap().server_revision);
                if (confirmed.is_err()) {
                    fail_run(report, "Recording push of " + item.collection + "/" + item.id +
                                         " failed: " + confirmed.unwrap_err().message);
                    return false;
                }
                ++report.pushed;
                progressed = true;
                emit entityCommitted(qstr(item.collection), qstr(item.id));
                continue;
            }

            const auto& error = pushed.unwrap_err();
            if (error.aborts_run()) {
                fail_run(report, std::string("Remote ") + std::string(to_string(error.kind)) +
                                     " error while pushing: " + error.message);
                return false;
            }

            blocked.insert(item.key());
            ++report.push_failures;

            auto outcome = store_.record_push_failure(item, error.message,
                                                      error.kind == RemoteError::Kind::Permanent);
            if (outcome.is_err()) {
                fail_run(report, "Recording failure of " + item.collection + "/" + item.id +
                                     " failed: " + outcome.unwrap_err().message);
                return false;
            }

            const auto& result = outcome.unwrap();
            if (result.dead_lettered) {
                ++report.dead_lettered;
                progressed = true;
                qWarning() << "SyncCoordinator: item" << item.sequence << "for"
                           << describe(item.key()) << "dead-lettered after"
                           << result.attempt_count << "attempts:" << qstr(error.message);
            } else {
                qDebug() << "SyncCoordinator: item" << item.sequence << "attempt"
                         << result.attempt_count << "failed, retry at"
                         << qstr(result.next_attempt_at.to_iso_string());
            }
        }

        if (!progressed) return true;
    }
}

bool SyncCoordinator::pull(SyncReport& report, std::vector<PulledCollection>& pulled) {
    const auto collections = options_.collections.empty() ? store_.collections()
                                                          : options_.collections;

    for (const auto& collection : collections) {
        if (cancelled(report)) return true;

        auto scheme = store_.revision_scheme(collection);
        if (scheme.is_err()) {
            fail_run(report, scheme.unwrap_err().message);
            return false;
        }

        auto cursor = store_.cursor(collection);
        if (cursor.is_err()) {
            fail_run(report, "Reading cursor of " + collection + " failed: " +
                                 cursor.unwrap_err().message);
            return false;
        }

        auto fetched = remote_.pull(collection, cursor.unwrap());
        if (fetched.is_err()) {
            const auto& error = fetched.unwrap_err();
            fail_run(report, "Pull of " + collection + " failed (" +
                                 std::string(to_string(error.kind)) + "): " + error.message);
            return false;
        }

        auto result = std::move(fetched).unwrap();
        PulledCollection batch{
            .collection = collection,
            .scheme = scheme.unwrap(),
            .next_cursor = std::move(result.next_cursor),
            .changes = {}
        };
        batch.changes.reserve(result.changes.size());
        for (auto& change : result.changes) {
            batch.changes.push_back(PlannedChange{
                .remote = Entity{
                    .collection = collection,
                    .id = std::move(change.id),
                    .payload = std::move(change.payload),
                    .revision = change.server_revision,
                    .updated_at = change.updated_at,
                    .is_deleted = change.deleted,
                    .sync_state = SyncState::Clean
                },
                .local = std::nullopt,
                .decision = {}
            });
        }

        report.pulled += static_cast<int>(batch.changes.size());
        pulled.push_back(std::move(batch));
    }
    return true;
}

bool SyncCoordinator::plan(SyncReport& report, std::vector<PulledCollection>& pulled) {
    for (auto& batch : pulled) {
        for (auto& change : batch.changes) {
            auto local = store_.get(batch.collection, change.remote.id,
                                    storage::ReadOptions{.include_tombstones = true});
            if (local.is_err()) {
                fail_run(report, "Reading " + batch.collection + "/" + change.remote.id +
                                     " failed: " + local.unwrap_err().message);
                return false;
            }
            change.local = std::move(local).unwrap();
            change.decision = decide(resolver_, batch.scheme, change.local, change.remote);
        }
    }
    return true;
}

Result<std::vector<EntityKey>> SyncCoordinator::commit(const std::vector<PulledCollection>& pulled,
                                                       SyncReport& report) {
    using R = Result<std::vector<EntityKey>>;

    CommitCounts counts;
    auto written = store_.write([&](storage::StoreTransaction& txn) -> R {
        counts = CommitCounts{};
        std::vector<EntityKey> keys;

        for (const auto& batch : pulled) {
            for (const auto& change : batch.changes) {
                const auto key = key_of(change.remote);
                auto loaded = txn.load(key);
                if (loaded.is_err()) return propagate<R>(std::move(loaded));
                const auto local = std::move(loaded).unwrap();

                // An application write landed since planning; decide again.
                const Decision decision = local == change.local
                                              ? change.decision
                                              : decide(resolver_, batch.scheme, local, change.remote);

                auto applied = apply_decision(txn, decision, local, change.remote, counts);
                if (applied.is_err()) return propagate<R>(std::move(applied));
                if (!applied.unwrap()) continue;

                if (decision.action == Action::MarkConflicted) {
                    qWarning() << "SyncCoordinator:" << describe(key)
                               << "left conflicted:" << qstr(decision.reason);
                }
                ++counts.committed;
                keys.push_back(key);
            }

            auto advanced = txn.set_cursor(batch.collection, batch.next_cursor);
            if (advanced.is_err()) return propagate<R>(std::move(advanced));
        }
        return R::ok(std::move(keys));
    });

    if (written.is_ok()) {
        report.stale_skipped += counts.stale_skipped;
        report.conflicts += counts.conflicts;
        report.conflicted += counts.conflicted;
        report.committed += counts.committed;
    }
    return written;
}

} // namespace tidemark::sync
