#pragma once

#include "core/queue_item.hpp"
#include "core/result.hpp"
#include "core/retry_policy.hpp"
#include "core/types.hpp"
#include "storage/database.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace tidemark::storage {

/**
 * FailOutcome - What fail() did to an item.
 */
struct FailOutcome {
    int attempt_count = 0;
    bool dead_lettered = false;
    Timestamp next_attempt_at;
};

/**
 * SyncQueue - Durable, ordered log of mutations still owed to the server.
 *
 * Lives in the same database as the entity tables. Methods do not open their
 * own transactions; LocalStore wraps them together with the entity write
 * they belong to.
 */
class SyncQueue {
public:
    SyncQueue(Database& db, RetryPolicy policy, const Clock& clock)
        : db_(db), policy_(policy), clock_(clock) {}

    /**
     * Append an item; returns its sequence. `sequence`, `attempt_count`,
     * `created_at` and `dead_letter` of the argument are ignored.
     */
    [[nodiscard]] Result<int64_t> enqueue(const QueueItem& item);

    /**
     * Up to `max` live (not dead-lettered) items, ascending by sequence.
     */
    [[nodiscard]] Result<std::vector<QueueItem>> peek_batch(size_t max);

    /**
     * Like peek_batch, but only items that may be sent at `now`: an item is
     * held back while it, or an earlier live item for the same key, is
     * inside its backoff window.
     */
    [[nodiscard]] Result<std::vector<QueueItem>> ready_batch(size_t max, Timestamp now);

    [[nodiscard]] Result<std::optional<QueueItem>> get(int64_t sequence);

    /**
     * Remove an item after the server confirmed it.
     */
    [[nodiscard]] Result<void> ack(int64_t sequence);

    /**
     * Record a failed attempt. Transient failures back off until the policy
     * is exhausted; permanent failures are dead-lettered at once.
     */
    [[nodiscard]] Result<FailOutcome> fail(int64_t sequence, const std::string& error, bool permanent);

    /**
     * Park an item without counting an attempt.
     */
    [[nodiscard]] Result<void> dead_letter(int64_t sequence, const std::string& reason);

    [[nodiscard]] Result<std::vector<QueueItem>> dead_letters();

    /**
     * Return a dead letter to the live queue with a fresh retry budget.
     */
    [[nodiscard]] Result<void> requeue_dead_letter(int64_t sequence);

    /**
     * Delete a dead letter. Live items cannot be discarded.
     */
    [[nodiscard]] Result<void> discard_dead_letter(int64_t sequence);

    /**
     * Live items for one entity, ascending by sequence.
     */
    [[nodiscard]] Result<std::vector<QueueItem>> pending_for(const EntityKey& key);
    [[nodiscard]] Result<std::vector<QueueItem>> dead_letters_for(const EntityKey& key);

    [[nodiscard]] Result<QueueStats> stats();

    [[nodiscard]] const RetryPolicy& policy() const { return policy_; }

private:
    Database& db_;
    RetryPolicy policy_;
    const Clock& clock_;

    [[nodiscard]] Result<std::vector<QueueItem>> select(const std::string& where_and_order,
                                                        const std::function<Result<void>(Statement&)>& bind);
    [[nodiscard]] Result<QueueItem> require(int64_t sequence);
    [[nodiscard]] static QueueItem row_to_item(Statement& stmt);
};

} // namespace tidemark::storage
