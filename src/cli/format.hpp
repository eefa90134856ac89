#pragma once

#include <QString>
#include <string>
#include <vector>

#include "core/entity.hpp"
#include "core/queue_item.hpp"
#include "storage/migrations.hpp"

namespace tidemark::cli {

// One line per entity:
//   <collection>/<id>  rev=<n>  <sync_state>  <updated_at>[  deleted]  <payload>
// JSON output is an array of objects with the same fields; payloads that are
// valid JSON are embedded as values, anything else as a string.
[[nodiscard]] QString format_entities(const std::vector<Entity>& entities, bool json);

[[nodiscard]] QString format_queue_items(const std::vector<QueueItem>& items, bool json);

struct StatusView {
    std::string database_path;
    storage::MigrationStatus migrations;
    QueueStats queue;
    std::vector<std::string> collections;
};

[[nodiscard]] QString format_status(const StatusView& status, bool json);

// True if `payload` parses as a JSON object or array.
[[nodiscard]] bool is_json_document(const QString& payload);

} // namespace tidemark::cli
