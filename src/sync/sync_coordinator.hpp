#pragma once

#include "core/conflict_resolver.hpp"
#include "core/entity.hpp"
#include "core/types.hpp"
#include "storage/local_store.hpp"
#include "sync/remote_api.hpp"
#include <QObject>
#include <QString>
#include <QTimer>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tidemark::sync {

/**
 * SyncPhase - State of the coordinator.
 */
enum class SyncPhase {
    Idle,
    Draining,
    Pulling,
    Resolving,
    Committing,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(SyncPhase phase) noexcept {
    switch (phase) {
        case SyncPhase::Idle: return "idle";
        case SyncPhase::Draining: return "draining";
        case SyncPhase::Pulling: return "pulling";
        case SyncPhase::Resolving: return "resolving";
        case SyncPhase::Committing: return "committing";
        case SyncPhase::Failed: return "failed";
    }
    return "idle";
}

enum class SyncTrigger {
    Manual,
    Connectivity,
    Timer
};

[[nodiscard]] constexpr std::string_view to_string(SyncTrigger trigger) noexcept {
    switch (trigger) {
        case SyncTrigger::Manual: return "manual";
        case SyncTrigger::Connectivity: return "connectivity";
        case SyncTrigger::Timer: return "timer";
    }
    return "manual";
}

/**
 * SyncReport - What one trigger_sync() call did.
 *
 * A coalesced report comes back from a trigger that arrived while another run
 * was active; that run picks the request up and nothing else was done here.
 */
struct SyncReport {
    SyncTrigger trigger = SyncTrigger::Manual;
    SyncPhase final_phase = SyncPhase::Idle;
    bool coalesced = false;
    bool cancelled = false;
    int runs = 0;

    int pushed = 0;
    int push_failures = 0;
    int dead_lettered = 0;
    int pulled = 0;
    int stale_skipped = 0;
    int conflicts = 0;
    int conflicted = 0;
    int committed = 0;

    std::optional<std::string> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

struct SyncOptions {
    size_t drain_batch_size = 50;
    // Collections to pull; empty means every registered collection.
    std::vector<std::string> collections;
};

/**
 * SyncCoordinator - Runs drain, pull, resolve and commit against one store.
 *
 * Only one run is active at a time. A trigger that arrives during a run is
 * folded into one more run after the current one; a failed run still honours
 * it, a cancelled one drops it. Remote calls happen with
 * no store lock held; each pull is resolved and committed in a single store
 * write that also advances the collection cursors, and signals go out only
 * after that write has committed.
 */
class SyncCoordinator : public QObject {
    Q_OBJECT

public:
    SyncCoordinator(storage::LocalStore& store,
                    const ConflictResolver& resolver,
                    RemoteApi& remote,
                    const Clock& clock,
                    SyncOptions options = {},
                    QObject* parent = nullptr);
    ~SyncCoordinator() override;

    /**
     * Run a sync now on the calling thread. Returns at once with a coalesced
     * report if a run is already active.
     */
    SyncReport trigger_sync(SyncTrigger trigger = SyncTrigger::Manual);

    /**
     * Queue a run on the coordinator's own thread and return immediately. The
     * outcome arrives through syncFinished. Safe from any thread.
     */
    void request_sync(SyncTrigger trigger = SyncTrigger::Manual);

    /**
     * Ask the active run to stop before its next queue item or collection.
     * A commit already underway completes.
     */
    void cancel();

    [[nodiscard]] SyncPhase phase() const { return phase_.load(); }
    [[nodiscard]] bool is_running() const;

    /**
     * Trigger runs from a QTimer on the coordinator's thread; zero stops the
     * timer. Callable from any thread.
     */
    void set_periodic_interval(std::chrono::milliseconds interval);

public slots:
    /**
     * Online edge (offline -> online) requests a run.
     */
    void on_connectivity_changed(bool online);

signals:
    void stateChanged(tidemark::sync::SyncPhase phase);
    void entityCommitted(const QString& collection, const QString& id);
    void syncFinished(const tidemark::sync::SyncReport& report);
    void syncFailed(const QString& message);

private:
    struct PlannedChange;
    struct PulledCollection;

    storage::LocalStore& store_;
    const ConflictResolver& resolver_;
    RemoteApi& remote_;
    const Clock& clock_;
    SyncOptions options_;
    QTimer* timer_;

    std::atomic<SyncPhase> phase_{SyncPhase::Idle};
    std::atomic<bool> cancel_requested_{false};
    mutable std::mutex run_mutex_;
    bool running_ = false;
    bool rerun_requested_ = false;
    bool online_ = false;

    void set_phase(SyncPhase phase);
    void run_once(SyncReport& report);
    [[nodiscard]] bool drain(SyncReport& report);
    [[nodiscard]] bool pull(SyncReport& report, std::vector<PulledCollection>& pulled);
    [[nodiscard]] bool plan(SyncReport& report, std::vector<PulledCollection>& pulled);
    [[nodiscard]] Result<std::vector<EntityKey>> commit(const std::vector<PulledCollection>& pulled,
                                                        SyncReport& report);
    [[nodiscard]] bool cancelled(SyncReport& report) const;
    void fail_run(SyncReport& report, const std::string& message);
};

} // namespace tidemark::sync

Q_DECLARE_METATYPE(tidemark::sync::SyncPhase)
Q_DECLARE_METATYPE(tidemark::sync::SyncReport)
