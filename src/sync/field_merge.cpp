#include "sync/field_merge.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <optional>

namespace tidemark::sync {

namespace {

std::optional<QJsonObject> parse_object(const std::string& payload, QJsonParseError* out_err) {
    const QByteArray bytes = QByteArray::fromStdString(payload);
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (out_err) *out_err = err;
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return doc.object();
}

Error not_an_object(const char* side, const Entity& entity, const QJsonParseError& err) {
    std::string reason = err.error != QJsonParseError::NoError
                             ? err.errorString().toStdString()
                             : std::string("payload is not a JSON object");
    return Error{ErrorKind::InvalidArgument,
                 std::string(side) + " payload of " + entity.collection + "/" + entity.id +
                     ": " + reason};
}

} // namespace

MergeFunction json_field_merge(std::set<std::string> local_owned) {
    return [owned = std::move(local_owned)](const Entity& local,
                                            const Entity& remote) -> Result<std::string> {
        QJsonParseError err{};
        const auto local_obj = parse_object(local.payload, &err);
        if (!local_obj) return Result<std::string>::err(not_an_object("local", local, err));

        const auto remote_obj = parse_object(remote.payload, &err);
        if (!remote_obj) return Result<std::string>::err(not_an_object("remote", remote, err));

        QJsonObject merged = *remote_obj;
        for (const auto& field : owned) {
            const auto key = QString::fromStdString(field);
            if (local_obj->contains(key)) {
                merged.insert(key, local_obj->value(key));
            } else {
                merged.remove(key);
            }
        }

        // QJsonObject keeps keys sorted, so the output is canonical.
        return Result<std::string>::ok(
            QJsonDocument(merged).toJson(QJsonDocument::Compact).toStdString());
    };
}

} // namespace tidemark::sync
