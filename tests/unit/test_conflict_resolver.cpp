#include <catch2/catch_test_macros.hpp>
#include "core/conflict_resolver.hpp"

using namespace tidemark;

namespace {

Entity make_entity(std::string payload, int64_t revision, int64_t updated_ms,
                   SyncState state = SyncState::Clean) {
    return Entity{
        .collection = "posts",
        .id = "p1",
        .payload = std::move(payload),
        .revision = revision,
        .updated_at = Timestamp(updated_ms),
        .is_deleted = false,
        .sync_state = state
    };
}

ConflictResolver resolver_with(ConflictStrategy strategy, MergeFunction merge = {}) {
    ConflictResolver resolver;
    resolver.set_policy("posts", CollectionPolicy{
        .strategy = strategy,
        .revision_scheme = RevisionScheme::ServerCounter,
        .merge = std::move(merge)
    });
    return resolver;
}

} // namespace

TEST_CASE("RemoteWins always takes the server value", "[resolver]") {
    auto resolver = resolver_with(ConflictStrategy::RemoteWins);
    const auto local = make_entity(R"({"likes":3})", 4, 2000, SyncState::PendingPush);
    const auto remote = make_entity(R"({"likes":5})", 5, 1000);

    auto record = resolver.resolve(local, remote).unwrap();
    REQUIRE(record.resolution == Resolution::RemoteWins);
    REQUIRE(record.resolved.payload == remote.payload);
    REQUIRE(record.resolved.revision == 5);
    REQUIRE(record.resolved.sync_state == SyncState::Clean);
    REQUIRE_FALSE(record.needs_push());
}

TEST_CASE("LocalWins keeps local content on the server revision", "[resolver]") {
    auto resolver = resolver_with(ConflictStrategy::LocalWins);
    const auto local = make_entity(R"({"draft":"mine"})", 2, 1000, SyncState::PendingPush);
    const auto remote = make_entity(R"({"draft":"theirs"})", 9, 5000);

    auto record = resolver.resolve(local, remote).unwrap();
    REQUIRE(record.resolution == Resolution::LocalWins);
    REQUIRE(record.resolved.payload == local.payload);
    REQUIRE(record.resolved.revision == 9);
    REQUIRE(record.needs_push());
    REQUIRE(record.resolved_at == Timestamp(5000));
}

TEST_CASE("LastWriteWins compares updated_at", "[resolver]") {
    auto resolver = resolver_with(ConflictStrategy::LastWriteWins);

    SECTION("newer local wins") {
        auto record = resolver.resolve(make_entity("{\"v\":1}", 1, 3000),
                                       make_entity("{\"v\":2}", 2, 2000)).unwrap();
        REQUIRE(record.resolution == Resolution::LocalWins);
        REQUIRE(record.resolved.payload == "{\"v\":1}");
        REQUIRE(record.needs_push());
    }

    SECTION("newer remote wins") {
        auto record = resolver.resolve(make_entity("{\"v\":1}", 1, 1000),
                                       make_entity("{\"v\":2}", 2, 2000)).unwrap();
        REQUIRE(record.resolution == Resolution::RemoteWins);
        REQUIRE(record.resolved.payload == "{\"v\":2}");
        REQUIRE_FALSE(record.needs_push());
    }

    SECTION("ties go to the server") {
        auto record = resolver.resolve(make_entity("{\"v\":1}", 1, 2000),
                                       make_entity("{\"v\":2}", 2, 2000)).unwrap();
        REQUIRE(record.resolution == Resolution::RemoteWins);
    }
}

TEST_CASE("FieldMerge uses the collection's merge function", "[resolver]") {
    auto concat = [](const Entity& local, const Entity& remote) -> Result<std::string> {
        return Result<std::string>::ok(local.payload + "+" + remote.payload);
    };
    auto resolver = resolver_with(ConflictStrategy::FieldMerge, concat);

    auto record = resolver.resolve(make_entity("a", 3, 1000), make_entity("b", 4, 900)).unwrap();
    REQUIRE(record.resolution == Resolution::Merged);
    REQUIRE(record.resolved.payload == "a+b");
    REQUIRE(record.resolved.revision == 4);
    REQUIRE(record.resolved.updated_at == Timestamp(1000));
    REQUIRE(record.needs_push());

    SECTION("a merge equal to the server value needs no push") {
        auto keep_remote = [](const Entity&, const Entity& remote) -> Result<std::string> {
            return Result<std::string>::ok(remote.payload);
        };
        auto same = resolver_with(ConflictStrategy::FieldMerge, keep_remote);
        auto merged = same.resolve(make_entity("a", 3, 1000), make_entity("b", 4, 900)).unwrap();
        REQUIRE(merged.resolution == Resolution::Merged);
        REQUIRE_FALSE(merged.needs_push());
    }
}

TEST_CASE("FieldMerge failures are reported", "[resolver]") {
    SECTION("no merge function") {
        auto resolver = resolver_with(ConflictStrategy::FieldMerge);
        auto result = resolver.resolve(make_entity("a", 1, 1), make_entity("b", 2, 2));
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::ConflictResolution);
    }

    SECTION("merge function rejects the pair") {
        auto reject = [](const Entity&, const Entity&) -> Result<std::string> {
            return Result<std::string>::err(Error{ErrorKind::InvalidArgument, "incompatible"});
        };
        auto resolver = resolver_with(ConflictStrategy::FieldMerge, reject);
        auto result = resolver.resolve(make_entity("a", 1, 1), make_entity("b", 2, 2));
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::ConflictResolution);
        REQUIRE(result.unwrap_err().message.find("incompatible") != std::string::npos);
    }
}

TEST_CASE("FieldMerge with a tombstone falls back to LastWriteWins", "[resolver]") {
    bool called = false;
    auto merge = [&called](const Entity&, const Entity&) -> Result<std::string> {
        called = true;
        return Result<std::string>::ok("{}");
    };
    auto resolver = resolver_with(ConflictStrategy::FieldMerge, merge);

    auto remote = make_entity("", 7, 5000);
    remote.is_deleted = true;
    auto record = resolver.resolve(make_entity("{\"v\":1}", 6, 4000), remote).unwrap();

    REQUIRE_FALSE(called);
    REQUIRE(record.resolution == Resolution::RemoteWins);
    REQUIRE(record.resolved.is_deleted);
}

TEST_CASE("Resolving different keys is rejected", "[resolver]") {
    ConflictResolver resolver;
    auto other = make_entity("{}", 1, 1);
    other.id = "p2";
    auto result = resolver.resolve(make_entity("{}", 1, 1), other);
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("Unconfigured collections use the default policy", "[resolver]") {
    ConflictResolver resolver(CollectionPolicy{.strategy = ConflictStrategy::RemoteWins});
    REQUIRE(resolver.policy_for("anything").strategy == ConflictStrategy::RemoteWins);

    resolver.set_policy("drafts", CollectionPolicy{.strategy = ConflictStrategy::LocalWins});
    REQUIRE(resolver.policy_for("drafts").strategy == ConflictStrategy::LocalWins);
}

TEST_CASE("Resolution is deterministic", "[resolver]") {
    auto resolver = resolver_with(ConflictStrategy::LastWriteWins);
    const auto local = make_entity("{\"v\":1}", 1, 3000);
    const auto remote = make_entity("{\"v\":2}", 2, 3000);
    REQUIRE(resolver.resolve(local, remote).unwrap() == resolver.resolve(local, remote).unwrap());
}
