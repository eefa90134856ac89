#include "engine/engine_config.hpp"

#include <QDir>
#include <QStandardPaths>
#include <QStringList>
#include <QtGlobal>

namespace tidemark::engine {

namespace {

constexpr const char* kEnvDatabasePath = "TIDEMARK_DB_PATH";

constexpr const char* kSettingsDatabasePath = "storage/path";
constexpr const char* kSettingsTargetVersion = "storage/target_version";
constexpr const char* kSettingsBaseDelay = "retry/base_delay_ms";
constexpr const char* kSettingsMultiplier = "retry/multiplier";
constexpr const char* kSettingsMaxDelay = "retry/max_delay_ms";
constexpr const char* kSettingsMaxAttempts = "retry/max_attempts";
constexpr const char* kSettingsJitter = "retry/jitter";
constexpr const char* kSettingsBatchSize = "sync/batch_size";
constexpr const char* kSettingsInterval = "sync/interval_ms";
constexpr const char* kSettingsDefaultStrategy = "sync/default_strategy";
constexpr const char* kSettingsCollections = "collections";

Error bad_setting(const QString& key, const QString& value) {
    return Error{ErrorKind::InvalidArgument,
                 "Invalid value for " + key.toStdString() + ": '" + value.toStdString() + "'"};
}

template<typename T, typename Convert>
Result<void> read_number(QSettings& settings, const char* key, T& out, Convert convert) {
    const auto name = QString::fromLatin1(key);
    if (!settings.contains(name)) return Result<void>::ok();

    bool ok = false;
    const auto value = settings.value(name);
    const T parsed = convert(value, &ok);
    if (!ok) return Result<void>::err(bad_setting(name, value.toString()));
    out = parsed;
    return Result<void>::ok();
}

Result<void> read_millis(QSettings& settings, const char* key, std::chrono::milliseconds& out) {
    qlonglong ms = out.count();
    auto read = read_number(settings, key, ms,
                            [](const QVariant& v, bool* ok) { return v.toLongLong(ok); });
    if (read.is_err()) return read;
    out = std::chrono::milliseconds(ms);
    return Result<void>::ok();
}

Result<ConflictStrategy> read_strategy(const QString& key, const QString& value) {
    auto parsed = parse_conflict_strategy(value.trimmed().toStdString());
    if (!parsed) return Result<ConflictStrategy>::err(bad_setting(key, value));
    return Result<ConflictStrategy>::ok(*parsed);
}

Result<CollectionConfig> read_collection(QSettings& settings, const QString& name) {
    CollectionConfig config;
    settings.beginGroup(name);

    const auto strategy = settings.value(QStringLiteral("strategy")).toString();
    if (!strategy.isEmpty()) {
        auto parsed = read_strategy(name + QStringLiteral("/strategy"), strategy);
        if (parsed.is_err()) {
            settings.endGroup();
            return propagate<Result<CollectionConfig>>(std::move(parsed));
        }
        config.strategy = parsed.unwrap();
    }

    const auto scheme = settings.value(QStringLiteral("revision_scheme")).toString();
    if (!scheme.isEmpty()) {
        config.revision_scheme = parse_revision_scheme(scheme.trimmed().toStdString());
        if (!config.revision_scheme) {
            settings.endGroup();
            return Result<CollectionConfig>::err(
                bad_setting(name + QStringLiteral("/revision_scheme"), scheme));
        }
    }

    // INI lists come back as QStringList; a single entry as QString.
    const auto fields = settings.value(QStringLiteral("local_fields")).toStringList();
    for (const auto& field : fields) {
        const auto trimmed = field.trimmed();
        if (!trimmed.isEmpty()) config.local_fields.insert(trimmed.toStdString());
    }

    settings.endGroup();
    return Result<CollectionConfig>::ok(std::move(config));
}

} // namespace

QString default_database_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QStringLiteral("tidemark.db");
    }
    return QDir(base).filePath(QStringLiteral("tidemark.db"));
}

Result<EngineConfig> EngineConfig::from_settings(QSettings& settings) {
    using R = Result<EngineConfig>;
    EngineConfig config;

    config.database_path =
        settings.value(QString::fromLatin1(kSettingsDatabasePath), default_database_path())
            .toString()
            .toStdString();
    if (qEnvironmentVariableIsSet(kEnvDatabasePath)) {
        config.database_path = qEnvironmentVariable(kEnvDatabasePath).toStdString();
    }

    if (settings.contains(QString::fromLatin1(kSettingsTargetVersion))) {
        int target = 0;
        auto read = read_number(settings, kSettingsTargetVersion, target,
                                [](const QVariant& v, bool* ok) { return v.toInt(ok); });
        if (read.is_err()) return propagate<R>(std::move(read));
        config.target_schema_version = target;
    }

    auto& retry = config.retry;
    for (auto read : {
             read_millis(settings, kSettingsBaseDelay, retry.base_delay),
             read_number(settings, kSettingsMultiplier, retry.multiplier,
                         [](const QVariant& v, bool* ok) { return v.toDouble(ok); }),
             read_millis(settings, kSettingsMaxDelay, retry.max_delay),
             read_number(settings, kSettingsMaxAttempts, retry.max_attempts,
                         [](const QVariant& v, bool* ok) { return v.toInt(ok); }),
             read_number(settings, kSettingsJitter, retry.jitter,
                         [](const QVariant& v, bool* ok) { return v.toDouble(ok); }),
             read_number(settings, kSettingsBatchSize, config.drain_batch_size,
                         [](const QVariant& v, bool* ok) {
                             return static_cast<size_t>(v.toUInt(ok));
                         }),
             read_millis(settings, kSettingsInterval, config.periodic_sync_interval),
         }) {
        if (read.is_err()) return propagate<R>(std::move(read));
    }

    const auto default_strategy =
        settings.value(QString::fromLatin1(kSettingsDefaultStrategy)).toString();
    if (!default_strategy.isEmpty()) {
        auto parsed = read_strategy(QString::fromLatin1(kSettingsDefaultStrategy), default_strategy);
        if (parsed.is_err()) return propagate<R>(std::move(parsed));
        config.default_strategy = parsed.unwrap();
    }

    settings.beginGroup(QString::fromLatin1(kSettingsCollections));
    const auto names = settings.childGroups();
    for (const auto& name : names) {
        auto collection = read_collection(settings, name);
        if (collection.is_err()) {
            settings.endGroup();
            return propagate<R>(std::move(collection));
        }
        config.collections[name.toStdString()] = std::move(collection).unwrap();
    }
    settings.endGroup();

    auto valid = config.validate();
    if (valid.is_err()) return propagate<R>(std::move(valid));
    return R::ok(std::move(config));
}

Result<void> EngineConfig::validate() const {
    if (database_path.empty()) {
        return Result<void>::err(Error{ErrorKind::InvalidArgument, "Database path is empty"});
    }
    if (target_schema_version && *target_schema_version < kRequiredSchemaVersion) {
        return Result<void>::err(Error{
            ErrorKind::InvalidArgument,
            "storage/target_version must be at least " + std::to_string(kRequiredSchemaVersion)});
    }
    if (!retry.valid()) {
        return Result<void>::err(Error{ErrorKind::InvalidArgument,
                                       "Retry policy needs 0 <= base_delay <= max_delay, "
                                       "multiplier >= 1, max_attempts >= 1, 0 <= jitter < 1"});
    }
    if (drain_batch_size == 0) {
        return Result<void>::err(Error{ErrorKind::InvalidArgument, "sync/batch_size must be positive"});
    }
    if (periodic_sync_interval.count() < 0) {
        return Result<void>::err(Error{ErrorKind::InvalidArgument, "sync/interval_ms must not be negative"});
    }
    for (const auto& [name, collection] : collections) {
        if (collection.strategy == ConflictStrategy::FieldMerge &&
            !collection.merge && collection.local_fields.empty()) {
            return Result<void>::err(Error{
                ErrorKind::InvalidArgument,
                "Collection " + name + " uses field_merge but names no local_fields"});
        }
    }
    return Result<void>::ok();
}

} // namespace tidemark::engine
