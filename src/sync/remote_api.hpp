#pragma once

#include "core/queue_item.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tidemark::sync {

/**
 * RemoteError - Failure reported by the server collaborator.
 */
struct RemoteError {
    enum class Kind {
        Transient,     // Retry with backoff (includes timeouts)
        Permanent,     // Validation rejection; dead-letter at once
        Connectivity,  // Server unreachable; abort the run
        AuthRejected   // Credentials refused; abort the run
    };

    Kind kind = Kind::Transient;
    std::string message;

    [[nodiscard]] bool aborts_run() const noexcept {
        return kind == Kind::Connectivity || kind == Kind::AuthRejected;
    }
};

[[nodiscard]] constexpr std::string_view to_string(RemoteError::Kind kind) noexcept {
    switch (kind) {
        case RemoteError::Kind::Transient: return "transient";
        case RemoteError::Kind::Permanent: return "permanent";
        case RemoteError::Kind::Connectivity: return "connectivity";
        case RemoteError::Kind::AuthRejected: return "auth_rejected";
    }
    return "transient";
}

struct PushRequest {
    int64_t sequence = 0;
    std::string collection;
    std::string id;
    Operation operation = Operation::Update;
    std::string payload;
};

struct PushAck {
    int64_t server_revision = 0;
};

/**
 * RemoteChange - One entity as the server currently has it.
 */
struct RemoteChange {
    std::string id;
    std::string payload;
    int64_t server_revision = 0;
    Timestamp updated_at;
    bool deleted = false;
};

struct PullResult {
    std::vector<RemoteChange> changes;
    std::string next_cursor;
};

/**
 * RemoteApi - Server collaborator. Requests arrive already authenticated;
 * timeouts are the implementation's business and surface as Transient.
 */
class RemoteApi {
public:
    virtual ~RemoteApi() = default;

    [[nodiscard]] virtual Result<PushAck, RemoteError> push(const PushRequest& request) = 0;

    /**
     * Changes in `collection` after `since_cursor` (everything when nullopt).
     */
    [[nodiscard]] virtual Result<PullResult, RemoteError> pull(
        const std::string& collection,
        const std::optional<std::string>& since_cursor) = 0;
};

} // namespace tidemark::sync
