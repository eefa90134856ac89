#include <QCoreApplication>
#include <QCommandLineParser>
#include <QSettings>
#include <QTextStream>
#include <memory>
#include <optional>

#include "cli/format.hpp"
#include "engine/engine_config.hpp"
#include "engine/logging.hpp"
#include "engine/offline_engine.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"

namespace {

using tidemark::engine::EngineConfig;
using tidemark::engine::OfflineEngine;

int fail(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return 1;
}

int fail(const std::string& message) {
    return fail(QString::fromStdString(message));
}

int usage(const QCommandLineParser& parser, const QString& message) {
    QTextStream(stderr) << message << QStringLiteral("\n\n") << parser.helpText();
    return 2;
}

std::optional<int64_t> parse_sequence(const QString& text) {
    bool ok = false;
    const auto value = text.toLongLong(&ok);
    if (!ok || value <= 0) return std::nullopt;
    return value;
}

// Runs against the raw database: a staged upgrade or an explicit downgrade
// may leave the store below what the engine needs.
int migrate(const EngineConfig& config, std::optional<int> requested, QTextStream& out) {
    auto db = tidemark::storage::Database::open(config.database_path);
    if (db.is_err()) return fail(db.unwrap_err().message);

    tidemark::storage::MigrationManager migrations(db.unwrap());
    auto current = migrations.current_version();
    if (current.is_err()) return fail(describe(current.unwrap_err()));

    const int target = requested.value_or(migrations.latest_version());
    const bool downgrade = target < current.unwrap();
    auto changed = downgrade ? migrations.rollback_to(target) : migrations.initialize(target);
    if (changed.is_err()) return fail(describe(changed.unwrap_err()));

    for (int version : changed.unwrap()) {
        out << (downgrade ? QStringLiteral("reverted v%1\n") : QStringLiteral("applied v%1\n"))
                   .arg(version);
    }

    auto status = migrations.status();
    if (status.is_err()) return fail(describe(status.unwrap_err()));
    out << QStringLiteral("schema: %1 of %2\n")
               .arg(status.unwrap().current_version)
               .arg(status.unwrap().latest_version);
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("tidemark");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Tidemark");
    app.setOrganizationDomain("tidemark.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Offline-first local data engine"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets TIDEMARK_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("config")},
        QStringLiteral("Read settings from this INI file instead of the user settings."),
        QStringLiteral("file"));
    parser.addOption(configOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption tombstonesOption(
        QStringList{QStringLiteral("tombstones")},
        QStringLiteral("Include deleted entities in 'list' and 'get'."));
    parser.addOption(tombstonesOption);

    const QCommandLineOption targetOption(
        QStringList{QStringLiteral("to")},
        QStringLiteral("Schema version for 'migrate' (lower than current rolls back)."),
        QStringLiteral("version"));
    parser.addOption(targetOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log")},
        QStringLiteral("Append log output to this file."),
        QStringLiteral("file"));
    parser.addOption(logFileOption);

    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("status | migrate | list <collection> | get <collection> <id> | "
                       "put <collection> <id> <json> | delete <collection> <id> | "
                       "dead-letters | requeue <sequence> | discard <sequence>"));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("TIDEMARK_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(logFileOption)) {
        const auto path = parser.value(logFileOption);
        if (!tidemark::install_file_logging(path)) {
            return fail(QStringLiteral("Cannot open log file ") + path);
        }
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usage(parser, QStringLiteral("No command given."));
    }
    const auto command = positional.first();
    const bool json = parser.isSet(jsonOption);

    std::unique_ptr<QSettings> settings = parser.isSet(configOption)
        ? std::make_unique<QSettings>(parser.value(configOption), QSettings::IniFormat)
        : std::make_unique<QSettings>();
    auto config_result = EngineConfig::from_settings(*settings);
    if (config_result.is_err()) return fail(config_result.unwrap_err().message);
    auto config = std::move(config_result).unwrap();

    if (command == QStringLiteral("migrate")) {
        std::optional<int> target;
        if (parser.isSet(targetOption)) {
            bool ok = false;
            target = parser.value(targetOption).toInt(&ok);
            if (!ok || *target < 0) return usage(parser, QStringLiteral("--to needs a version number."));
        }
        QTextStream out(stdout);
        return migrate(config, target, out);
    }

    auto opened = OfflineEngine::open(std::move(config));
    if (opened.is_err()) return fail(opened.unwrap_err().message);
    auto engine = std::move(opened).unwrap();

    QTextStream out(stdout);
    const tidemark::storage::ReadOptions read_options{
        .include_tombstones = parser.isSet(tombstonesOption)};

    if (command == QStringLiteral("status")) {
        auto migrations = engine->migration_status();
        if (migrations.is_err()) return fail(describe(migrations.unwrap_err()));
        auto queue = engine->queue_stats();
        if (queue.is_err()) return fail(queue.unwrap_err().message);

        out << tidemark::cli::format_status(tidemark::cli::StatusView{
                                                .database_path = engine->config().database_path,
                                                .migrations = std::move(migrations).unwrap(),
                                                .queue = queue.unwrap(),
                                                .collections = engine->collections()},
                                            json);
        return 0;
    }

    if (command == QStringLiteral("list")) {
        if (positional.size() != 2) return usage(parser, QStringLiteral("list <collection>"));
        auto entities = engine->list(positional.at(1).toStdString(), {}, read_options).collect();
        if (entities.is_err()) return fail(entities.unwrap_err().message);
        out << tidemark::cli::format_entities(entities.unwrap(), json);
        return 0;
    }

    if (command == QStringLiteral("get")) {
        if (positional.size() != 3) return usage(parser, QStringLiteral("get <collection> <id>"));
        auto entity = engine->get(positional.at(1).toStdString(), positional.at(2).toStdString(),
                                  read_options);
        if (entity.is_err()) return fail(entity.unwrap_err().message);
        if (!entity.unwrap()) {
            return fail(QStringLiteral("Not found: ") + positional.at(1) + QLatin1Char('/') +
                        positional.at(2));
        }
        out << tidemark::cli::format_entities({*entity.unwrap()}, json);
        return 0;
    }

    if (command == QStringLiteral("put")) {
        if (positional.size() != 4) return usage(parser, QStringLiteral("put <collection> <id> <json>"));
        const auto payload = positional.at(3);
        if (!tidemark::cli::is_json_document(payload)) {
            return fail(QStringLiteral("Payload must be a JSON object or array."));
        }
        auto entity = engine->put(positional.at(1).toStdString(), positional.at(2).toStdString(),
                                  payload.toStdString());
        if (entity.is_err()) return fail(entity.unwrap_err().message);
        out << tidemark::cli::format_entities({entity.unwrap()}, json);
        return 0;
    }

    if (command == QStringLiteral("delete")) {
        if (positional.size() != 3) return usage(parser, QStringLiteral("delete <collection> <id>"));
        auto removed = engine->remove(positional.at(1).toStdString(), positional.at(2).toStdString());
        if (removed.is_err()) return fail(removed.unwrap_err().message);
        return 0;
    }

    if (command == QStringLiteral("dead-letters")) {
        auto items = engine->dead_letters();
        if (items.is_err()) return fail(items.unwrap_err().message);
        out << tidemark::cli::format_queue_items(items.unwrap(), json);
        return 0;
    }

    if (command == QStringLiteral("requeue") || command == QStringLiteral("discard")) {
        if (positional.size() != 2) return usage(parser, command + QStringLiteral(" <sequence>"));
        const auto sequence = parse_sequence(positional.at(1));
        if (!sequence) return usage(parser, QStringLiteral("Sequence must be a positive integer."));

        auto done = command == QStringLiteral("requeue") ? engine->requeue_dead_letter(*sequence)
                                                         : engine->discard_dead_letter(*sequence);
        if (done.is_err()) return fail(done.unwrap_err().message);
        return 0;
    }

    return usage(parser, QStringLiteral("Unknown command: ") + command);
}
