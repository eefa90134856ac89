#include <catch2/catch_test_macros.hpp>

#include "engine/offline_engine.hpp"
#include "fake_remote.hpp"

#include <QEventLoop>
#include <QThread>
#include <QTimer>
#include <atomic>
#include <future>

using namespace tidemark;
using namespace tidemark::engine;
using tidemark::sync::SyncPhase;
using tidemark::sync::SyncReport;
using tidemark::sync::SyncTrigger;
using tidemark::testing::FakeRemote;
using namespace std::chrono_literals;

namespace {

EngineConfig memory_config() {
    EngineConfig config;
    config.database_path = ":memory:";
    config.retry = RetryPolicy{
        .base_delay = 1000ms,
        .multiplier = 2.0,
        .max_delay = 60'000ms,
        .max_attempts = 3,
        .jitter = 0.0
    };
    return config;
}

struct SyncFixture {
    ManualClock clock;
    FakeRemote remote{clock};
    std::unique_ptr<OfflineEngine> engine;

    explicit SyncFixture(EngineConfig config = memory_config()) {
        auto opened = OfflineEngine::open(std::move(config), &remote, &clock);
        REQUIRE(opened.is_ok());
        engine = std::move(opened).unwrap();
    }

    SyncReport sync(SyncTrigger trigger = SyncTrigger::Manual) {
        auto report = engine->trigger_sync(trigger);
        REQUIRE(report.is_ok());
        return std::move(report).unwrap();
    }

    Entity entity(const std::string& collection, const std::string& id) {
        auto loaded = engine->get(collection, id, storage::ReadOptions{.include_tombstones = true});
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.unwrap().has_value());
        return *loaded.unwrap();
    }

    bool exists(const std::string& collection, const std::string& id) {
        auto loaded = engine->get(collection, id, storage::ReadOptions{.include_tombstones = true});
        REQUIRE(loaded.is_ok());
        return loaded.unwrap().has_value();
    }

    QueueStats stats() { return engine->queue_stats().unwrap(); }
};

} // namespace

TEST_CASE("A local create is pushed and confirmed", "[sync]") {
    SyncFixture f;
    REQUIRE(f.engine->put("posts", "p1", R"({"title":"hello"})").is_ok());

    auto report = f.sync();
    REQUIRE(report.ok());
    REQUIRE(report.runs == 1);
    REQUIRE(report.pushed == 1);
    REQUIRE(report.final_phase == SyncPhase::Idle);

    REQUIRE(f.remote.pushes.size() == 1);
    REQUIRE(f.remote.pushes.front().operation == Operation::Create);
    REQUIRE(f.remote.pushes.front().payload == R"({"title":"hello"})");

    auto entity = f.entity("posts", "p1");
    REQUIRE(entity.sync_state == SyncState::Clean);
    REQUIRE(entity.revision == f.remote.revision_counter());
    REQUIRE(f.stats().pending == 0);

    SECTION("the echo of our own push is skipped as stale") {
        REQUIRE(report.pulled == 1);
        REQUIRE(report.stale_skipped == 1);
        REQUIRE(report.committed == 0);
    }

    SECTION("a second sync has nothing to do") {
        auto again = f.sync();
        REQUIRE(again.pushed == 0);
        REQUIRE(again.pulled == 0);
        REQUIRE(f.remote.pushes.size() == 1);
    }
}

TEST_CASE("Mutations of one entity are pushed in order", "[sync]") {
    SyncFixture f;
    REQUIRE(f.engine->put("posts", "p1", R"({"v":1})").is_ok());
    REQUIRE(f.engine->put("posts", "p2", R"({"v":1})").is_ok());
    REQUIRE(f.engine->put("posts", "p1", R"({"v":2})").is_ok());
    REQUIRE(f.engine->remove("posts", "p2").is_ok());

    auto report = f.sync();
    REQUIRE(report.pushed == 4);

    std::vector<std::pair<std::string, Operation>> seen;
    for (const auto& push : f.remote.pushes) seen.emplace_back(push.id, push.operation);
    REQUIRE(seen == std::vector<std::pair<std::string, Operation>>{
                        {"p1", Operation::Create},
                        {"p2", Operation::Create},
                        {"p1", Operation::Update},
                        {"p2", Operation::Delete}});

    REQUIRE(f.entity("posts", "p1").payload == R"({"v":2})");
    REQUIRE_FALSE(f.exists("posts", "p2"));
    REQUIRE(f.remote.record("posts", "p2")->deleted);
}

TEST_CASE("Remote changes are applied to clean entities", "[sync]") {
    SyncFixture f;
    f.remote.write("posts", "p7", R"({"from":"server"})", f.clock.now());

    auto first = f.sync();
    REQUIRE(first.pulled == 1);
    REQUIRE(first.committed == 1);
    auto applied = f.entity("posts", "p7");
    REQUIRE(applied.payload == R"({"from":"server"})");
    REQUIRE(applied.sync_state == SyncState::Clean);
    REQUIRE(f.stats().pending == 0);

    SECTION("a later server update replaces it") {
        f.remote.write("posts", "p7", R"({"from":"server","v":2})", f.clock.now());
        REQUIRE(f.sync().committed == 1);
        REQUIRE(f.entity("posts", "p7").payload == R"({"from":"server","v":2})");
    }

    SECTION("a server deletion purges it") {
        f.remote.write("posts", "p7", "", f.clock.now(), true);
        REQUIRE(f.sync().committed == 1);
        REQUIRE_FALSE(f.exists("posts", "p7"));
    }

    SECTION("a deletion of something never seen is ignored") {
        f.remote.write("posts", "ghost", "", f.clock.now(), true);
        auto report = f.sync();
        REQUIRE(report.pulled == 1);
        REQUIRE(report.committed == 0);
        REQUIRE_FALSE(f.exists("posts", "ghost"));
    }
}

TEST_CASE("LastWriteWins settles a local edit against a server edit", "[sync][conflict]") {
    SyncFixture f;
    f.remote.push_hook = [](const sync::PushRequest&) {
        return std::optional<sync::RemoteError>(testing::transient());
    };
    REQUIRE(f.engine->put("posts", "p1", R"({"by":"local"})").is_ok());

    SECTION("newer server value wins and the local push is parked") {
        f.remote.write("posts", "p1", R"({"by":"server"})", f.clock.now() + 5s);

        auto report = f.sync();
        REQUIRE(report.ok());
        REQUIRE(report.push_failures == 1);
        REQUIRE(report.conflicts == 1);

        auto entity = f.entity("posts", "p1");
        REQUIRE(entity.payload == R"({"by":"server"})");
        REQUIRE(entity.sync_state == SyncState::Clean);

        auto dead = f.engine->dead_letters().unwrap();
        REQUIRE(dead.size() == 1);
        REQUIRE(dead.front().last_error == "superseded by remote");
        REQUIRE(f.stats().pending == 0);
    }

    SECTION("newer local value wins and is pushed once the server is back") {
        f.remote.write("posts", "p1", R"({"by":"server"})", f.clock.now() - 5s);

        auto report = f.sync();
        REQUIRE(report.conflicts == 1);
        auto kept = f.entity("posts", "p1");
        REQUIRE(kept.payload == R"({"by":"local"})");
        REQUIRE(kept.sync_state == SyncState::PendingPush);
        // Still one item: the queued push already carries the local value.
        REQUIRE(f.engine->pending_items().unwrap().size() == 1);

        f.remote.push_hook = nullptr;
        f.clock.advance(1s);
        auto retried = f.sync();
        REQUIRE(retried.pushed == 1);
        REQUIRE(f.remote.record("posts", "p1")->payload == R"({"by":"local"})");
        REQUIRE(f.entity("posts", "p1").sync_state == SyncState::Clean);
    }
}

TEST_CASE("RemoteWins and LocalWins follow the collection policy", "[sync][conflict]") {
    auto config = memory_config();
    config.collections["comments"] = CollectionConfig{.strategy = ConflictStrategy::RemoteWins};
    config.collections["saved_posts"] = CollectionConfig{.strategy = ConflictStrategy::LocalWins};
    SyncFixture f(std::move(config));

    f.remote.push_hook = [](const sync::PushRequest&) {
        return std::optional<sync::RemoteError>(testing::transient());
    };
    REQUIRE(f.engine->put("comments", "c1", R"({"text":"local"})").is_ok());
    REQUIRE(f.engine->put("saved_posts", "s1", R"({"note":"local"})").is_ok());
    // Older than the local edits: only the policy decides.
    f.remote.write("comments", "c1", R"({"text":"server"})", f.clock.now() - 1h);
    f.remote.write("saved_posts", "s1", R"({"note":"server"})", f.clock.now() + 1h);

    auto report = f.sync();
    REQUIRE(report.conflicts == 2);
    REQUIRE(f.entity("comments", "c1").payload == R"({"text":"server"})");
    REQUIRE(f.entity("saved_posts", "s1").payload == R"({"note":"local"})");
    REQUIRE(f.entity("saved_posts", "s1").sync_state == SyncState::PendingPush);
}

TEST_CASE("FieldMerge combines local and server fields", "[sync][conflict]") {
    auto config = memory_config();
    config.collections["profiles"] = CollectionConfig{
        .strategy = ConflictStrategy::FieldMerge,
        .revision_scheme = RevisionScheme::ServerCounter,
        .local_fields = {"bio"},
        .merge = {}
    };
    SyncFixture f(std::move(config));

    f.remote.push_hook = [](const sync::PushRequest&) {
        return std::optional<sync::RemoteError>(testing::transient());
    };

    SECTION("merged value is pushed") {
        REQUIRE(f.engine->put("profiles", "u1", R"({"bio":"local bio","name":"Al"})").is_ok());
        f.remote.write("profiles", "u1", R"({"bio":"old bio","name":"Alice"})", f.clock.now());

        auto report = f.sync();
        REQUIRE(report.conflicts == 1);
        REQUIRE(report.conflicted == 0);
        const std::string merged = R"({"bio":"local bio","name":"Alice"})";
        REQUIRE(f.entity("profiles", "u1").payload == merged);
        REQUIRE(f.entity("profiles", "u1").sync_state == SyncState::PendingPush);

        f.remote.push_hook = nullptr;
        f.clock.advance(2s);
        auto retried = f.sync();
        REQUIRE(retried.ok());
        REQUIRE(f.remote.pushes.back().payload == merged);
        REQUIRE(f.remote.record("profiles", "u1")->payload == merged);
        REQUIRE(f.entity("profiles", "u1").sync_state == SyncState::Clean);
        REQUIRE(f.stats().pending == 0);
    }

    SECTION("a failed merge leaves the entity for the application") {
        REQUIRE(f.engine->put("profiles", "u1", "not json").is_ok());
        f.remote.write("profiles", "u1", R"({"bio":"server"})", f.clock.now());

        auto report = f.sync();
        REQUIRE(report.ok());
        REQUIRE(report.conflicted == 1);
        REQUIRE(f.entity("profiles", "u1").sync_state == SyncState::Conflicted);

        auto conflicted = f.engine->conflicted("profiles").unwrap();
        REQUIRE(conflicted.size() == 1);
        REQUIRE(conflicted.front().id == "u1");

        // The local push is parked and the server side is kept for the application.
        REQUIRE(f.stats().pending == 0);
        auto parked = f.engine->dead_letters().unwrap();
        REQUIRE(parked.size() == 1);
        REQUIRE(parked.front().last_error == storage::kParkedForConflict);

        auto snapshot = f.engine->conflict_snapshot("profiles", "u1").unwrap();
        REQUIRE(snapshot.has_value());
        REQUIRE(snapshot->remote.payload == R"({"bio":"server"})");
        REQUIRE(snapshot->reason.find("Merge of profiles/u1 failed") != std::string::npos);

        SECTION("the server value survives later runs") {
            f.remote.push_hook = nullptr;
            f.clock.advance(2s);
            const auto pushes_before = f.remote.pushes.size();

            auto next = f.sync();
            REQUIRE(next.ok());
            REQUIRE(next.pushed == 0);
            REQUIRE(f.remote.pushes.size() == pushes_before);
            REQUIRE(f.remote.record("profiles", "u1")->payload == R"({"bio":"server"})");
            REQUIRE(f.entity("profiles", "u1").sync_state == SyncState::Conflicted);
        }

        SECTION("resolving pushes the application's value") {
            auto settled = f.engine->resolve_conflict("profiles", "u1", R"({"bio":"fixed"})");
            REQUIRE(settled.is_ok());
            REQUIRE(settled.unwrap().sync_state == SyncState::PendingPush);
            REQUIRE(f.engine->dead_letters().unwrap().empty());
            REQUIRE_FALSE(f.engine->conflict_snapshot("profiles", "u1").unwrap().has_value());

            f.remote.push_hook = nullptr;
            f.clock.advance(2s);
            REQUIRE(f.sync().ok());
            REQUIRE(f.remote.record("profiles", "u1")->payload == R"({"bio":"fixed"})");
            REQUIRE(f.engine->conflicted("profiles").unwrap().empty());
        }

        SECTION("a new local edit settles the conflict too") {
            REQUIRE(f.engine->put("profiles", "u1", R"({"bio":"rewritten"})").is_ok());
            REQUIRE(f.engine->dead_letters().unwrap().empty());
            REQUIRE_FALSE(f.engine->conflict_snapshot("profiles", "u1").unwrap().has_value());
            REQUIRE(f.stats().pending == 1);
        }
    }
}

TEST_CASE("Transient failures back off until the ceiling", "[sync][retry]") {
    SyncFixture f;
    f.remote.push_hook = [](const sync::PushRequest&) {
        return std::optional<sync::RemoteError>(testing::transient("503"));
    };
    REQUIRE(f.engine->put("posts", "p1", "{}").is_ok());

    auto first = f.sync();
    REQUIRE(first.ok());
    REQUIRE(first.push_failures == 1);
    REQUIRE(f.stats().backing_off == 1);

    SECTION("nothing is sent inside the backoff window") {
        auto early = f.sync();
        REQUIRE(early.push_failures == 0);
        REQUIRE(f.remote.pushes.size() == 1);
    }

    SECTION("the last allowed attempt dead-letters the item") {
        f.clock.advance(1s);
        REQUIRE(f.sync().push_failures == 1);
        f.clock.advance(2s);
        auto last = f.sync();
        REQUIRE(last.dead_lettered == 1);
        REQUIRE(f.remote.pushes.size() == 3);

        auto dead = f.engine->dead_letters().unwrap();
        REQUIRE(dead.size() == 1);
        REQUIRE(dead.front().attempt_count == 3);
        REQUIRE(dead.front().last_error == "503");
        REQUIRE(f.entity("posts", "p1").sync_state == SyncState::PendingPush);

        // Parked items are not retried on their own.
        f.clock.advance(1h);
        REQUIRE(f.sync().push_failures == 0);

        f.remote.push_hook = nullptr;
        REQUIRE(f.engine->requeue_dead_letter(dead.front().sequence).is_ok());
        REQUIRE(f.sync().pushed == 1);
        REQUIRE(f.entity("posts", "p1").sync_state == SyncState::Clean);
    }
}

TEST_CASE("Permanent rejections are dead-lettered at once", "[sync][retry]") {
    SyncFixture f;
    f.remote.push_hook = [](const sync::PushRequest& request) -> std::optional<sync::RemoteError> {
        if (request.id == "bad") return testing::permanent("title required");
        return std::nullopt;
    };
    REQUIRE(f.engine->put("posts", "bad", "{}").is_ok());
    REQUIRE(f.engine->put("posts", "good", R"({"title":"ok"})").is_ok());

    auto report = f.sync();
    REQUIRE(report.ok());
    REQUIRE(report.dead_lettered == 1);
    REQUIRE(report.pushed == 1);

    auto dead = f.engine->dead_letters().unwrap();
    REQUIRE(dead.size() == 1);
    REQUIRE(dead.front().id == "bad");
    REQUIRE(dead.front().last_error == "title required");

    SECTION("a discarded dead letter is gone for good") {
        REQUIRE(f.engine->discard_dead_letter(dead.front().sequence).is_ok());
        REQUIRE(f.engine->dead_letters().unwrap().empty());
    }
}

TEST_CASE("A failing key does not hold back other keys", "[sync][retry]") {
    SyncFixture f;
    f.remote.push_hook = [](const sync::PushRequest& request) -> std::optional<sync::RemoteError> {
        if (request.id == "slow") return testing::transient();
        return std::nullopt;
    };
    REQUIRE(f.engine->put("posts", "slow", R"({"v":1})").is_ok());
    REQUIRE(f.engine->put("posts", "slow", R"({"v":2})").is_ok());
    REQUIRE(f.engine->put("posts", "fast", R"({"v":1})").is_ok());

    auto report = f.sync();
    REQUIRE(report.pushed == 1);
    REQUIRE(report.push_failures == 1);

    // The second "slow" item was never attempted.
    int slow_pushes = 0;
    for (const auto& push : f.remote.pushes) slow_pushes += push.id == "slow" ? 1 : 0;
    REQUIRE(slow_pushes == 1);
    REQUIRE(f.engine->pending_items().unwrap().size() == 2);
}

TEST_CASE("Connectivity loss aborts the run and keeps everything queued", "[sync][failure]") {
    SyncFixture f;

    SECTION("during drain") {
        f.remote.push_hook = [](const sync::PushRequest&) {
            return std::optional<sync::RemoteError>(testing::unreachable());
        };
        REQUIRE(f.engine->put("posts", "p1", "{}").is_ok());

        auto report = f.sync();
        REQUIRE_FALSE(report.ok());
        REQUIRE(report.final_phase == SyncPhase::Failed);
        REQUIRE(f.remote.pull_calls == 0);

        auto pending = f.engine->pending_items().unwrap();
        REQUIRE(pending.size() == 1);
        REQUIRE(pending.front().attempt_count == 0);
        REQUIRE(f.engine->coordinator()->phase() == SyncPhase::Idle);
    }

    SECTION("during pull") {
        f.remote.write("posts", "p1", R"({"v":1})", f.clock.now());
        f.remote.pull_error = testing::unreachable();

        auto report = f.sync();
        REQUIRE_FALSE(report.ok());
        REQUIRE(report.error->find("connectivity") != std::string::npos);
        REQUIRE_FALSE(f.exists("posts", "p1"));

        // The cursor did not move, so the change arrives on the next run.
        f.remote.pull_error.reset();
        auto retried = f.sync();
        REQUIRE(retried.ok());
        REQUIRE(f.entity("posts", "p1").payload == R"({"v":1})");
    }

    SECTION("auth rejection aborts like connectivity") {
        f.remote.push_hook = [](const sync::PushRequest&) {
            return std::optional<sync::RemoteError>(
                sync::RemoteError{sync::RemoteError::Kind::AuthRejected, "token expired"});
        };
        REQUIRE(f.engine->put("posts", "p1", "{}").is_ok());
        REQUIRE_FALSE(f.sync().ok());
        REQUIRE(f.engine->dead_letters().unwrap().empty());
    }
}

TEST_CASE("A trigger during a run is folded into one rerun", "[sync][coordinator]") {
    SyncFixture f;
    REQUIRE(f.engine->put("posts", "p1", "{}").is_ok());

    std::vector<SyncReport> nested;
    f.remote.on_push = [&](const sync::PushRequest&) {
        if (nested.size() < 2) {
            nested.push_back(f.engine->trigger_sync(SyncTrigger::Timer).unwrap());
        }
    };

    auto report = f.sync();
    REQUIRE(nested.size() == 1);
    REQUIRE(nested.front().coalesced);
    REQUIRE(nested.front().runs == 0);
    REQUIRE(report.runs == 2);
    REQUIRE(report.pushed == 1);
    REQUIRE_FALSE(f.engine->coordinator()->is_running());
}

TEST_CASE("A trigger during a failing run still gets its rerun", "[sync][coordinator]") {
    SyncFixture f;
    REQUIRE(f.engine->put("posts", "p1", "{}").is_ok());

    // The network comes back while the first push is failing on it.
    bool network_down = true;
    f.remote.on_push = [&](const sync::PushRequest&) {
        f.engine->coordinator()->on_connectivity_changed(true);
    };
    f.remote.push_hook = [&](const sync::PushRequest&) -> std::optional<sync::RemoteError> {
        if (!network_down) return std::nullopt;
        network_down = false;
        return testing::unreachable();
    };

    int failures = 0;
    QObject context;
    QObject::connect(f.engine->coordinator(), &sync::SyncCoordinator::syncFailed, &context,
                     [&](const QString&) { ++failures; });

    auto report = f.sync();
    REQUIRE(report.runs == 2);
    REQUIRE(report.ok());
    REQUIRE(report.pushed == 1);
    REQUIRE(report.final_phase == SyncPhase::Idle);
    REQUIRE(failures == 1);
    REQUIRE(f.remote.pushes.size() == 2);
    REQUIRE(f.stats().pending == 0);
    REQUIRE_FALSE(f.engine->coordinator()->is_running());

    SECTION("cancellation still drops the rerun") {
        REQUIRE(f.engine->put("posts", "p2", "{}").is_ok());
        f.engine->on_connectivity_changed(false);
        f.remote.on_push = [&](const sync::PushRequest&) {
            f.engine->coordinator()->on_connectivity_changed(true);
            f.engine->cancel_sync();
        };
        const int pulls_before = f.remote.pull_calls;

        auto cancelled = f.sync();
        REQUIRE(cancelled.cancelled);
        REQUIRE(cancelled.runs == 1);
        REQUIRE(f.remote.pull_calls == pulls_before);
    }
}

TEST_CASE("An application write during commit is decided again", "[sync][conflict]") {
    SyncFixture f;
    f.remote.write("posts", "p1", R"({"v":"server"})", f.clock.now());

    // Planned as a plain server apply; the write below lands before the commit.
    QObject context;
    QObject::connect(f.engine->coordinator(), &sync::SyncCoordinator::stateChanged, &context,
                     [&](SyncPhase phase) {
                         if (phase != SyncPhase::Committing) return;
                         f.clock.advance(1s);
                         REQUIRE(f.engine->put("posts", "p1", R"({"v":"local"})").is_ok());
                     }, Qt::DirectConnection);

    auto report = f.sync();
    REQUIRE(report.ok());
    REQUIRE(report.conflicts == 1);

    auto entity = f.entity("posts", "p1");
    REQUIRE(entity.payload == R"({"v":"local"})");
    REQUIRE(entity.sync_state == SyncState::PendingPush);

    auto pending = f.engine->pending_items().unwrap();
    REQUIRE(pending.size() == 1);
    REQUIRE(pending.front().payload == R"({"v":"local"})");
    REQUIRE(f.remote.record("posts", "p1")->payload == R"({"v":"server"})");
}

TEST_CASE("Cancel stops before the next queue item", "[sync][coordinator]") {
    SyncFixture f;
    REQUIRE(f.engine->put("posts", "p1", "{}").is_ok());
    REQUIRE(f.engine->put("posts", "p2", "{}").is_ok());

    f.remote.on_push = [&](const sync::PushRequest&) { f.engine->cancel_sync(); };

    auto report = f.sync();
    REQUIRE(report.cancelled);
    REQUIRE(report.ok());
    REQUIRE(report.pushed == 1);
    REQUIRE(f.remote.pull_calls == 0);
    REQUIRE(f.engine->pending_items().unwrap().size() == 1);

    SECTION("the next run starts fresh") {
        f.remote.on_push = nullptr;
        auto next = f.sync();
        REQUIRE_FALSE(next.cancelled);
        REQUIRE(next.pushed == 1);
    }
}

TEST_CASE("Coordinator signals follow the run", "[sync][coordinator]") {
    SyncFixture f;
    auto* coordinator = f.engine->coordinator();
    REQUIRE(coordinator != nullptr);

    QObject context;
    std::vector<SyncPhase> phases;
    std::vector<QString> committed;
    std::vector<QString> failures;
    int finished = 0;
    QObject::connect(coordinator, &sync::SyncCoordinator::stateChanged, &context,
                     [&](SyncPhase phase) { phases.push_back(phase); });
    QObject::connect(coordinator, &sync::SyncCoordinator::entityCommitted, &context,
                     [&](const QString& collection, const QString& id) {
                         committed.push_back(collection + QLatin1Char('/') + id);
                     });
    QObject::connect(coordinator, &sync::SyncCoordinator::syncFinished, &context,
                     [&](const SyncReport&) { ++finished; });
    QObject::connect(coordinator, &sync::SyncCoordinator::syncFailed, &context,
                     [&](const QString& message) { failures.push_back(message); });

    SECTION("successful run") {
        REQUIRE(f.engine->put("posts", "p1", "{}").is_ok());
        f.remote.write("comments", "c1", R"({"text":"hi"})", f.clock.now());

        REQUIRE(f.sync().ok());
        REQUIRE(phases == std::vector<SyncPhase>{SyncPhase::Draining, SyncPhase::Pulling,
                                                 SyncPhase::Resolving, SyncPhase::Committing,
                                                 SyncPhase::Idle});
        REQUIRE(committed == std::vector<QString>{QStringLiteral("posts/p1"),
                                                  QStringLiteral("comments/c1")});
        REQUIRE(finished == 1);
        REQUIRE(failures.empty());
    }

    SECTION("failed run") {
        f.remote.pull_error = testing::unreachable();
        REQUIRE_FALSE(f.sync().ok());
        REQUIRE(phases == std::vector<SyncPhase>{SyncPhase::Draining, SyncPhase::Pulling,
                                                 SyncPhase::Failed, SyncPhase::Idle});
        REQUIRE(failures.size() == 1);
        REQUIRE(finished == 1);
    }
}

TEST_CASE("Connectivity edges trigger runs", "[sync][coordinator]") {
    SyncFixture f;
    std::vector<SyncTrigger> triggers;
    QObject context;
    QObject::connect(f.engine->coordinator(), &sync::SyncCoordinator::syncFinished, &context,
                     [&](const SyncReport& report) { triggers.push_back(report.trigger); });

    // Edge runs happen on the sync thread; wait for each before the next edge.
    auto wait_for_runs = [&](size_t count) {
        QEventLoop loop;
        QTimer poll;
        QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
            if (triggers.size() >= count) loop.quit();
        });
        poll.start(5);
        QTimer::singleShot(5000, &loop, &QEventLoop::quit);
        loop.exec();
    };

    f.engine->on_connectivity_changed(true);
    f.engine->on_connectivity_changed(true);
    wait_for_runs(1);
    REQUIRE(triggers.size() == 1);

    f.engine->on_connectivity_changed(false);
    f.engine->on_connectivity_changed(true);
    wait_for_runs(2);

    REQUIRE(triggers == std::vector<SyncTrigger>{SyncTrigger::Connectivity,
                                                 SyncTrigger::Connectivity});
}

TEST_CASE("The periodic timer triggers runs", "[sync][coordinator]") {
    auto config = memory_config();
    config.periodic_sync_interval = 20ms;
    SyncFixture f(std::move(config));

    std::optional<SyncTrigger> seen;
    QEventLoop loop;
    QObject::connect(f.engine->coordinator(), &sync::SyncCoordinator::syncFinished, &loop,
                     [&](const SyncReport& report) {
                         seen = report.trigger;
                         loop.quit();
                     });
    QTimer::singleShot(5000, &loop, &QEventLoop::quit);
    loop.exec();

    REQUIRE(seen == std::optional<SyncTrigger>(SyncTrigger::Timer));
    f.engine->coordinator()->set_periodic_interval(0ms);
}

TEST_CASE("Requested runs leave the caller's thread free", "[sync][coordinator]") {
    SyncFixture f;
    REQUIRE(f.engine->put("posts", "p1", R"({"v":1})").is_ok());

    std::promise<void> first_push;
    auto pushing = first_push.get_future();
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> signalled{false};
    f.remote.on_push = [&](const sync::PushRequest&) {
        if (signalled.exchange(true)) return;
        first_push.set_value();
        released.wait();
    };

    QObject context;
    std::atomic<QThread*> run_thread{nullptr};
    QObject::connect(f.engine->coordinator(), &sync::SyncCoordinator::stateChanged, &context,
                     [&](SyncPhase phase) {
                         if (phase == SyncPhase::Draining) run_thread = QThread::currentThread();
                     }, Qt::DirectConnection);

    std::optional<SyncReport> finished;
    QEventLoop loop;
    QObject::connect(f.engine->coordinator(), &sync::SyncCoordinator::syncFinished, &loop,
                     [&](const SyncReport& report) {
                         finished = report;
                         loop.quit();
                     });

    REQUIRE(f.engine->request_sync().is_ok());
    REQUIRE(pushing.wait_for(5s) == std::future_status::ready);

    // The run is blocked inside the remote; the store stays usable here.
    REQUIRE(f.engine->put("posts", "p2", R"({"v":2})").is_ok());
    REQUIRE(f.entity("posts", "p2").payload == R"({"v":2})");
    REQUIRE(f.engine->coordinator()->is_running());
    REQUIRE(f.engine->trigger_sync().unwrap().coalesced);

    release.set_value();
    QTimer::singleShot(5000, &loop, &QEventLoop::quit);
    loop.exec();

    REQUIRE(finished.has_value());
    REQUIRE(finished->ok());
    REQUIRE(run_thread.load() != nullptr);
    REQUIRE(run_thread.load() != QThread::currentThread());
    REQUIRE(f.entity("posts", "p2").sync_state == SyncState::Clean);
    REQUIRE(f.stats().pending == 0);
}

TEST_CASE("An engine without a remote refuses to sync", "[sync]") {
    auto opened = OfflineEngine::open(memory_config());
    REQUIRE(opened.is_ok());
    auto engine = std::move(opened).unwrap();

    REQUIRE(engine->coordinator() == nullptr);
    auto report = engine->trigger_sync();
    REQUIRE(report.is_err());
    REQUIRE(report.unwrap_err().kind == ErrorKind::InvalidArgument);
    REQUIRE(engine->request_sync().is_err());

    // Local work is unaffected.
    REQUIRE(engine->put("posts", "p1", "{}").is_ok());
    REQUIRE(engine->queue_stats().unwrap().pending == 1);
}
