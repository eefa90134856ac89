#include "storage/sync_queue.hpp"

#include <functional>

namespace tidemark::storage {

namespace {

constexpr const char* kColumns =
    "SELECT sequence, collection, entity_id, operation, payload, attempt_count, "
    "created_at, last_error, next_attempt_at, dead_letter FROM sync_queue ";

Result<void> no_binds(Statement&) {
    return Result<void>::ok();
}

} // namespace

QueueItem SyncQueue::row_to_item(Statement& stmt) {
    return QueueItem{
        .sequence = stmt.column_int64(0),
        .collection = stmt.column_text(1),
        .id = stmt.column_text(2),
        .operation = parse_operation(stmt.column_text(3)).value_or(Operation::Update),
        .payload = stmt.column_text(4),
        .attempt_count = stmt.column_int(5),
        .created_at = Timestamp(stmt.column_int64(6)),
        .last_error = stmt.column_text(7),
        .next_attempt_at = Timestamp(stmt.column_int64(8)),
        .dead_letter = stmt.column_int(9) != 0
    };
}

Result<std::vector<QueueItem>> SyncQueue::select(
    const std::string& where_and_order,
    const std::function<Result<void>(Statement&)>& bind
) {
    auto stmt_result = db_.prepare(std::string(kColumns) + where_and_order);
    if (stmt_result.is_err()) return propagate<Result<std::vector<QueueItem>>>(std::move(stmt_result));

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = bind(stmt);
    if (bound.is_err()) return propagate<Result<std::vector<QueueItem>>>(std::move(bound));

    std::vector<QueueItem> items;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) return propagate<Result<std::vector<QueueItem>>>(std::move(step_result));
        if (!step_result.unwrap()) break;
        items.push_back(row_to_item(stmt));
    }
    return Result<std::vector<QueueItem>>::ok(std::move(items));
}

Result<QueueItem> SyncQueue::require(int64_t sequence) {
    auto found = get(sequence);
    if (found.is_err()) return propagate<Result<QueueItem>>(std::move(found));
    auto item = std::move(found).unwrap();
    if (!item) {
        return Result<QueueItem>::err(Error{ErrorKind::NotFound,
                                            "No queue item with sequence " + std::to_string(sequence)});
    }
    return Result<QueueItem>::ok(std::move(*item));
}

Result<int64_t> SyncQueue::enqueue(const QueueItem& item) {
    const auto now = clock_.now();
    auto inserted = db_.execute_bound(R"SQL(
        INSERT INTO sync_queue
            (collection, entity_id, operation, payload, attempt_count, created_at,
             last_error, next_attempt_at, dead_letter)
        VALUES (?, ?, ?, ?, 0, ?, '', ?, 0);
    )SQL", [&](Statement& stmt) {
        return stmt.bind_text(1, item.collection)
            .and_then([&] { return stmt.bind_text(2, item.id); })
            .and_then([&] { return stmt.bind_text(3, to_string(item.operation)); })
            .and_then([&] { return stmt.bind_text(4, item.payload); })
            .and_then([&] { return stmt.bind_int64(5, now.millis()); })
            .and_then([&] { return stmt.bind_int64(6, now.millis()); });
    });
    if (inserted.is_err()) return propagate<Result<int64_t>>(std::move(inserted));
    return Result<int64_t>::ok(db_.last_insert_rowid());
}

Result<std::vector<QueueItem>> SyncQueue::peek_batch(size_t max) {
    return select("WHERE dead_letter = 0 ORDER BY sequence LIMIT ?;", [&](Statement& stmt) {
        return stmt.bind_int64(1, static_cast<int64_t>(max));
    });
}

Result<std::vector<QueueItem>> SyncQueue::ready_batch(size_t max, Timestamp now) {
    return select(R"SQL(
        AS q
        WHERE q.dead_letter = 0
          AND q.next_attempt_at <= ?1
          AND NOT EXISTS (
              SELECT 1 FROM sync_queue AS p
              WHERE p.collection = q.collection
                AND p.entity_id = q.entity_id
                AND p.dead_letter = 0
                AND p.sequence < q.sequence
                AND p.next_attempt_at > ?1)
        ORDER BY q.sequence
        LIMIT ?2;
    )SQL", [&](Statement& stmt) {
        return stmt.bind_int64(1, now.millis())
            .and_then([&] { return stmt.bind_int64(2, static_cast<int64_t>(max)); });
    });
}

Result<std::optional<QueueItem>> SyncQueue::get(int64_t sequence) {
    auto rows = select("WHERE sequence = ?;", [&](Statement& stmt) {
        return stmt.bind_int64(1, sequence);
    });
    if (rows.is_err()) return propagate<Result<std::optional<QueueItem>>>(std::move(rows));

    auto items = std::move(rows).unwrap();
    if (items.empty()) return Result<std::optional<QueueItem>>::ok(std::nullopt);
    return Result<std::optional<QueueItem>>::ok(std::move(items.front()));
}

Result<void> SyncQueue::ack(int64_t sequence) {
    auto item = require(sequence);
    if (item.is_err()) return propagate<Result<void>>(std::move(item));
    if (item.unwrap().dead_letter) {
        return Result<void>::err(Error{ErrorKind::InvalidArgument,
                                       "Cannot ack dead-lettered item " + std::to_string(sequence)});
    }
    return db_.execute_bound("DELETE FROM sync_queue WHERE sequence = ?;", [&](Statement& stmt) {
        return stmt.bind_int64(1, sequence);
    });
}

Result<FailOutcome> SyncQueue::fail(int64_t sequence, const std::string& error, bool permanent) {
    auto found = require(sequence);
    if (found.is_err()) return propagate<Result<FailOutcome>>(std::move(found));
    const auto item = std::move(found).unwrap();
    if (item.dead_letter) {
        return Result<FailOutcome>::err(Error{ErrorKind::InvalidArgument,
                                              "Item " + std::to_string(sequence) + " is already dead-lettered"});
    }

    const auto now = clock_.now();
    FailOutcome outcome{
        .attempt_count = item.attempt_count + 1,
        .dead_lettered = false,
        .next_attempt_at = now
    };
    outcome.dead_lettered = permanent || policy_.exhausted(outcome.attempt_count);
    if (!outcome.dead_lettered) {
        outcome.next_attempt_at = policy_.next_attempt_at(now, sequence, outcome.attempt_count);
    }

    auto updated = db_.execute_bound(R"SQL(
        UPDATE sync_queue
        SET attempt_count = ?, last_error = ?, next_attempt_at = ?,
            dead_letter = ?, dead_lettered_at = CASE WHEN ? THEN ? ELSE NULL END
        WHERE sequence = ?;
    )SQL", [&](Statement& stmt) {
        return stmt.bind_int(1, outcome.attempt_count)
            .and_then([&] { return stmt.bind_text(2, error); })
            .and_then([&] { return stmt.bind_int64(3, outcome.next_attempt_at.millis()); })
            .and_then([&] { return stmt.bind_int(4, outcome.dead_lettered ? 1 : 0); })
            .and_then([&] { return stmt.bind_int(5, outcome.dead_lettered ? 1 : 0); })
            .and_then([&] { return stmt.bind_int64(6, now.millis()); })
            .and_then([&] { return stmt.bind_int64(7, sequence); });
    });
    if (updated.is_err()) return propagate<Result<FailOutcome>>(std::move(updated));
    return Result<FailOutcome>::ok(outcome);
}

Result<void> SyncQueue::dead_letter(int64_t sequence, const std::string& reason) {
    auto found = require(sequence);
    if (found.is_err()) return propagate<Result<void>>(std::move(found));

    return db_.execute_bound(R"SQL(
        UPDATE sync_queue SET dead_letter = 1, last_error = ?, dead_lettered_at = ?
        WHERE sequence = ?;
    )SQL", [&](Statement& stmt) {
        return stmt.bind_text(1, reason)
            .and_then([&] { return stmt.bind_int64(2, clock_.now().millis()); })
            .and_then([&] { return stmt.bind_int64(3, sequence); });
    });
}

Result<std::vector<QueueItem>> SyncQueue::dead_letters() {
    return select("WHERE dead_letter = 1 ORDER BY sequence;", no_binds);
}

Result<void> SyncQueue::requeue_dead_letter(int64_t sequence) {
    auto found = require(sequence);
    if (found.is_err()) return propagate<Result<void>>(std::move(found));
    if (!found.unwrap().dead_letter) {
        return Result<void>::err(Error{ErrorKind::InvalidArgument,
                                       "Item " + std::to_string(sequence) + " is not dead-lettered"});
    }

    return db_.execute_bound(R"SQL(
        UPDATE sync_queue
        SET dead_letter = 0, dead_lettered_at = NULL, attempt_count = 0, next_attempt_at = ?
        WHERE sequence = ?;
    )SQL", [&](Statement& stmt) {
        return stmt.bind_int64(1, clock_.now().millis())
            .and_then([&] { return stmt.bind_int64(2, sequence); });
    });
}

Result<void> SyncQueue::discard_dead_letter(int64_t sequence) {
    auto found = require(sequence);
    if (found.is_err()) return propagate<Result<void>>(std::move(found));
    if (!found.unwrap().dead_letter) {
        return Result<void>::err(Error{ErrorKind::InvalidArgument,
                                       "Refusing to discard live item " + std::to_string(sequence)});
    }
    return db_.execute_bound("DELETE FROM sync_queue WHERE sequence = ?;", [&](Statement& stmt) {
        return stmt.bind_int64(1, sequence);
    });
}

Result<std::vector<QueueItem>> SyncQueue::pending_for(const EntityKey& key) {
    return select("WHERE dead_letter = 0 AND collection = ? AND entity_id = ? ORDER BY sequence;",
                  [&](Statement& stmt) {
                      return stmt.bind_text(1, key.collection)
                          .and_then([&] { return stmt.bind_text(2, key.id); });
                  });
}

Result<std::vector<QueueItem>> SyncQueue::dead_letters_for(const EntityKey& key) {
    return select("WHERE dead_letter = 1 AND collection = ? AND entity_id = ? ORDER BY sequence;",
                  [&](Statement& stmt) {
                      return stmt.bind_text(1, key.collection)
                          .and_then([&] { return stmt.bind_text(2, key.id); });
                  });
}

Result<QueueStats> SyncQueue::stats() {
    QueueStats stats;
    const auto now = clock_.now().millis();
    auto read = db_.query(
        "SELECT dead_letter, next_attempt_at > " + std::to_string(now) +
            ", COUNT(*) FROM sync_queue GROUP BY 1, 2;",
        [&](Statement& stmt) {
            const bool dead = stmt.column_int(0) != 0;
            const bool waiting = stmt.column_int(1) != 0;
            const auto count = stmt.column_int64(2);
            if (dead) {
                stats.dead_letters += count;
            } else {
                stats.pending += count;
                if (waiting) stats.backing_off += count;
            }
        });
    if (read.is_err()) return propagate<Result<QueueStats>>(std::move(read));
    return Result<QueueStats>::ok(stats);
}

} // namespace tidemark::storage
