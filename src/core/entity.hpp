#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tidemark {

/**
 * SyncState - Where an entity stands relative to the server.
 */
enum class SyncState {
    Clean,        // Matches the last server-confirmed value
    PendingPush,  // Local mutation not yet confirmed
    Conflicted    // Needs an application-level decision
};

[[nodiscard]] constexpr std::string_view to_string(SyncState s) noexcept {
    switch (s) {
        case SyncState::Clean: return "clean";
        case SyncState::PendingPush: return "pending_push";
        case SyncState::Conflicted: return "conflicted";
    }
    return "clean";
}

[[nodiscard]] inline std::optional<SyncState> parse_sync_state(std::string_view s) {
    if (s == "clean") return SyncState::Clean;
    if (s == "pending_push") return SyncState::PendingPush;
    if (s == "conflicted") return SyncState::Conflicted;
    return std::nullopt;
}

/**
 * RevisionScheme - How revisions of a collection are compared.
 */
enum class RevisionScheme {
    ServerCounter,  // Integer assigned by the server; larger is newer
    Timestamp       // updated_at decides
};

[[nodiscard]] constexpr std::string_view to_string(RevisionScheme s) noexcept {
    return s == RevisionScheme::ServerCounter ? "server_counter" : "timestamp";
}

[[nodiscard]] inline std::optional<RevisionScheme> parse_revision_scheme(std::string_view s) {
    if (s == "server_counter") return RevisionScheme::ServerCounter;
    if (s == "timestamp") return RevisionScheme::Timestamp;
    return std::nullopt;
}

/**
 * Entity - A record in a domain collection.
 *
 * `payload` is opaque JSON text; the store never looks inside it.
 */
struct Entity {
    std::string collection;
    std::string id;
    std::string payload;
    int64_t revision = 0;
    Timestamp updated_at;
    bool is_deleted = false;
    SyncState sync_state = SyncState::Clean;

    bool operator==(const Entity&) const = default;
};

/**
 * EntityKey - (collection, id), unique across the store.
 */
struct EntityKey {
    std::string collection;
    std::string id;

    auto operator<=>(const EntityKey&) const = default;
    bool operator==(const EntityKey&) const = default;
};

[[nodiscard]] inline EntityKey key_of(const Entity& e) {
    return EntityKey{e.collection, e.id};
}

} // namespace tidemark
