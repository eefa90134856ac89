#include "cli/format.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStringList>

namespace tidemark::cli {

namespace {

[[nodiscard]] QString qstr(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

[[nodiscard]] QJsonValue payload_value(const std::string& payload) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(payload), &err);
    if (err.error != QJsonParseError::NoError) {
        return QJsonValue(qstr(payload));
    }
    if (doc.isObject()) return doc.object();
    return doc.array();
}

[[nodiscard]] QString to_json_text(const QJsonDocument& doc) {
    return QString::fromUtf8(doc.toJson(QJsonDocument::Indented));
}

[[nodiscard]] QJsonObject entity_json(const Entity& e) {
    QJsonObject obj;
    obj[QStringLiteral("collection")] = qstr(e.collection);
    obj[QStringLiteral("id")] = qstr(e.id);
    obj[QStringLiteral("revision")] = static_cast<qint64>(e.revision);
    obj[QStringLiteral("updatedAt")] = qstr(e.updated_at.to_iso_string());
    obj[QStringLiteral("deleted")] = e.is_deleted;
    obj[QStringLiteral("syncState")] = qstr(to_string(e.sync_state));
    obj[QStringLiteral("payload")] = payload_value(e.payload);
    return obj;
}

[[nodiscard]] QJsonObject queue_item_json(const QueueItem& item) {
    QJsonObject obj;
    obj[QStringLiteral("sequence")] = static_cast<qint64>(item.sequence);
    obj[QStringLiteral("collection")] = qstr(item.collection);
    obj[QStringLiteral("id")] = qstr(item.id);
    obj[QStringLiteral("operation")] = qstr(to_string(item.operation));
    obj[QStringLiteral("attempts")] = item.attempt_count;
    obj[QStringLiteral("createdAt")] = qstr(item.created_at.to_iso_string());
    obj[QStringLiteral("deadLetter")] = item.dead_letter;
    if (!item.last_error.empty()) {
        obj[QStringLiteral("lastError")] = qstr(item.last_error);
    }
    if (!item.dead_letter) {
        obj[QStringLiteral("nextAttemptAt")] = qstr(item.next_attempt_at.to_iso_string());
    }
    return obj;
}

} // namespace

QString format_entities(const std::vector<Entity>& entities, bool json) {
    if (json) {
        QJsonArray arr;
        for (const auto& e : entities) arr.append(entity_json(e));
        return to_json_text(QJsonDocument(arr));
    }

    QStringList lines;
    for (const auto& e : entities) {
        QStringList fields{
            qstr(e.collection) + QLatin1Char('/') + qstr(e.id),
            QStringLiteral("rev=%1").arg(e.revision),
            qstr(to_string(e.sync_state)),
            qstr(e.updated_at.to_iso_string())
        };
        if (e.is_deleted) fields.append(QStringLiteral("deleted"));
        fields.append(qstr(e.payload));
        lines.append(fields.join(QStringLiteral("  ")));
    }
    return lines.isEmpty() ? QString{} : lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_queue_items(const std::vector<QueueItem>& items, bool json) {
    if (json) {
        QJsonArray arr;
        for (const auto& item : items) arr.append(queue_item_json(item));
        return to_json_text(QJsonDocument(arr));
    }

    QStringList lines;
    for (const auto& item : items) {
        auto line = QStringLiteral("#%1  %2 %3/%4  attempts=%5")
                        .arg(item.sequence)
                        .arg(qstr(to_string(item.operation)), qstr(item.collection), qstr(item.id))
                        .arg(item.attempt_count);
        if (!item.last_error.empty()) {
            line += QStringLiteral("  error=\"") + qstr(item.last_error) + QLatin1Char('"');
        }
        lines.append(line);
    }
    return lines.isEmpty() ? QString{} : lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_status(const StatusView& status, bool json) {
    const auto& m = status.migrations;

    if (json) {
        QJsonObject schema;
        schema[QStringLiteral("current")] = m.current_version;
        schema[QStringLiteral("latest")] = m.latest_version;
        QJsonArray applied;
        for (const auto& record : m.applied) {
            QJsonObject r;
            r[QStringLiteral("version")] = record.version;
            r[QStringLiteral("name")] = qstr(record.name);
            r[QStringLiteral("executedAt")] = qstr(record.executed_at.to_iso_string());
            applied.append(r);
        }
        schema[QStringLiteral("applied")] = applied;
        QJsonArray pending;
        for (int v : m.pending) pending.append(v);
        schema[QStringLiteral("pending")] = pending;

        QJsonObject queue;
        queue[QStringLiteral("pending")] = static_cast<qint64>(status.queue.pending);
        queue[QStringLiteral("backingOff")] = static_cast<qint64>(status.queue.backing_off);
        queue[QStringLiteral("deadLetters")] = static_cast<qint64>(status.queue.dead_letters);

        QJsonArray collections;
        for (const auto& c : status.collections) collections.append(qstr(c));

        QJsonObject root;
        root[QStringLiteral("database")] = qstr(status.database_path);
        root[QStringLiteral("schema")] = schema;
        root[QStringLiteral("queue")] = queue;
        root[QStringLiteral("collections")] = collections;
        return to_json_text(QJsonDocument(root));
    }

    QStringList lines;
    lines.append(QStringLiteral("database: ") + qstr(status.database_path));
    lines.append(QStringLiteral("schema: %1 of %2").arg(m.current_version).arg(m.latest_version));
    for (const auto& record : m.applied) {
        lines.append(QStringLiteral("  v%1 %2 (%3)")
                         .arg(record.version)
                         .arg(qstr(record.name), qstr(record.executed_at.to_iso_string())));
    }
    for (int v : m.pending) {
        lines.append(QStringLiteral("  v%1 pending").arg(v));
    }

    QStringList names;
    for (const auto& c : status.collections) names.append(qstr(c));
    lines.append(QStringLiteral("collections: ") + names.join(QStringLiteral(", ")));
    lines.append(QStringLiteral("queue: %1 pending (%2 backing off), %3 dead letters")
                     .arg(status.queue.pending)
                     .arg(status.queue.backing_off)
                     .arg(status.queue.dead_letters));
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

bool is_json_document(const QString& payload) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(payload.toUtf8(), &err);
    return err.error == QJsonParseError::NoError && (doc.isObject() || doc.isArray());
}

} // namespace tidemark::cli
