#pragma once

#include "core/entity.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tidemark {

enum class Operation {
    Create,
    Update,
    Delete
};

[[nodiscard]] constexpr std::string_view to_string(Operation op) noexcept {
    switch (op) {
        case Operation::Create: return "create";
        case Operation::Update: return "update";
        case Operation::Delete: return "delete";
    }
    return "update";
}

[[nodiscard]] inline std::optional<Operation> parse_operation(std::string_view s) {
    if (s == "create") return Operation::Create;
    if (s == "update") return Operation::Update;
    if (s == "delete") return Operation::Delete;
    return std::nullopt;
}

/**
 * QueueItem - One pending mutation waiting to reach the server.
 *
 * `sequence` is assigned by the queue on enqueue and is strictly increasing.
 * Items are removed by ack() or parked as dead letters, never dropped.
 */
struct QueueItem {
    int64_t sequence = 0;
    std::string collection;
    std::string id;
    Operation operation = Operation::Update;
    std::string payload;  // Snapshot at enqueue time; empty for Delete
    int attempt_count = 0;
    Timestamp created_at;
    std::string last_error;
    Timestamp next_attempt_at;
    bool dead_letter = false;

    [[nodiscard]] EntityKey key() const { return EntityKey{collection, id}; }

    bool operator==(const QueueItem&) const = default;
};

/**
 * QueueStats - Snapshot of queue occupancy.
 */
struct QueueStats {
    int64_t pending = 0;
    int64_t backing_off = 0;
    int64_t dead_letters = 0;
};

} // namespace tidemark
