#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

#include "cli/commands.hpp"
#include "cli/config.hpp"
#include "cli/json_output.hpp"
#include "cli/logging.hpp"
#include "service/task_service.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

int report(const rollplan::Error& error, int exitCode) {
    QTextStream(stderr) << rollplan::cli::to_text(rollplan::cli::error_to_json(error));
    return exitCode;
}

int print(const rollplan::Result<QJsonObject>& result) {
    if (result.is_err()) {
        qCWarning(lcCli) << "command failed:" << result.unwrap_err().message.c_str();
        return report(result.unwrap_err(), EXIT_FAILED);
    }
    QTextStream(stdout) << rollplan::cli::to_text(result.unwrap());
    return EXIT_OK;
}

std::optional<QString> optional_value(const QCommandLineParser& parser, const QCommandLineOption& option) {
    if (!parser.isSet(option)) return std::nullopt;
    return parser.value(option);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("rollplan");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("rollplan");
    app.setOrganizationDomain("rollplan.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Rolling work plan for project work items"));
    const auto helpOption = parser.addHelpOption();
    const auto versionOption = parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Database path (overrides ROLLPLAN_DB_PATH)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Log file path (overrides ROLLPLAN_LOG_FILE)."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption busyTimeoutOption(
        QStringList{QStringLiteral("busy-timeout")},
        QStringLiteral("Milliseconds to wait for the write lock (overrides ROLLPLAN_BUSY_TIMEOUT_MS)."),
        QStringLiteral("ms"));
    parser.addOption(busyTimeoutOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("verbose")},
        QStringLiteral("Mirror log output to stderr."));
    parser.addOption(verboseOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging."));
    parser.addOption(debugOption);

    const QCommandLineOption projectOption(
        QStringList{QStringLiteral("project")},
        QStringLiteral("Project identifier (from 'identify')."),
        QStringLiteral("id"));
    parser.addOption(projectOption);

    const QCommandLineOption idOption(
        QStringList{QStringLiteral("id")},
        QStringLiteral("Work item ID for 'update', 'complete' and 'log'."),
        QStringLiteral("itemId"));
    parser.addOption(idOption);

    const QCommandLineOption typeOption(
        QStringList{QStringLiteral("type")},
        QStringLiteral("Item type for 'create': project, phase, task or subtask."),
        QStringLiteral("type"));
    parser.addOption(typeOption);

    const QCommandLineOption titleOption(
        QStringList{QStringLiteral("title")},
        QStringLiteral("Item title for 'create'."),
        QStringLiteral("title"));
    parser.addOption(titleOption);

    const QCommandLineOption descriptionOption(
        QStringList{QStringLiteral("description")},
        QStringLiteral("Item description for 'create'."),
        QStringLiteral("text"));
    parser.addOption(descriptionOption);

    const QCommandLineOption parentOption(
        QStringList{QStringLiteral("parent")},
        QStringLiteral("Parent item ID for 'create'."),
        QStringLiteral("itemId"));
    parser.addOption(parentOption);

    const QCommandLineOption notesOption(
        QStringList{QStringLiteral("notes")},
        QStringLiteral("Item notes for 'create'."),
        QStringLiteral("text"));
    parser.addOption(notesOption);

    const QCommandLineOption setOption(
        QStringList{QStringLiteral("set")},
        QStringLiteral("Field assignment for 'update' (repeatable)."),
        QStringLiteral("field=value"));
    parser.addOption(setOption);

    const QCommandLineOption limitOption(
        QStringList{QStringLiteral("limit")},
        QStringLiteral("Most recent entries to show for 'log'."),
        QStringLiteral("n"));
    parser.addOption(limitOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("identify, plan, create, update, complete, search or log."));
    parser.addPositionalArgument(QStringLiteral("args"),
                                 QStringLiteral("Descriptor for 'identify', query for 'search'."),
                                 QStringLiteral("[args...]"));

    if (!parser.parse(app.arguments())) {
        return report(rollplan::Error::invalid_argument(parser.errorText().toStdString()), EXIT_USAGE);
    }
    if (parser.isSet(helpOption)) {
        parser.showHelp(EXIT_OK);
    }
    if (parser.isSet(versionOption)) {
        parser.showVersion();
    }

    auto positional = parser.positionalArguments();
    if (positional.isEmpty() || !rollplan::cli::is_known_command(positional.first())) {
        const auto given = positional.isEmpty() ? QStringLiteral("(none)") : positional.first();
        return report(rollplan::Error::invalid_argument("Unknown command: " + given.toStdString()),
                      EXIT_USAGE);
    }
    const auto command = positional.takeFirst();

    auto configResult = rollplan::cli::resolve_config(rollplan::cli::ConfigOverrides{
        .databasePath = optional_value(parser, dbPathOption),
        .logFilePath = optional_value(parser, logFileOption),
        .busyTimeoutMs = optional_value(parser, busyTimeoutOption),
        .verbose = parser.isSet(verboseOption),
        .debug = parser.isSet(debugOption),
    });
    if (configResult.is_err()) {
        return report(configResult.unwrap_err(), EXIT_USAGE);
    }
    const auto config = std::move(configResult).unwrap();

    rollplan::cli::set_debug_logging(config.debug);
    rollplan::cli::install_file_logging(config.logFilePath, config.verbose);
    qCDebug(lcCli) << "rollplan: logging to" << config.logFilePath;

    if (command == QStringLiteral("identify")) {
        if (positional.size() != 1) {
            return report(rollplan::Error::invalid_argument("identify takes exactly one descriptor"),
                          EXIT_USAGE);
        }
        return print(rollplan::cli::identify_command({.descriptor = positional.first()}));
    }

    if (!QDir().mkpath(QFileInfo(config.databasePath).absolutePath())) {
        return report(rollplan::Error{"Cannot create directory for " + config.databasePath.toStdString()},
                      EXIT_FAILED);
    }

    qCInfo(lcStore) << "opening" << config.databasePath << "busy timeout" << config.busyTimeoutMs << "ms";
    auto dbResult = rollplan::storage::Database::open(rollplan::cli::store_options(config));
    if (dbResult.is_err()) {
        qCCritical(lcStore) << "open failed:" << dbResult.unwrap_err().message.c_str();
        return report(dbResult.unwrap_err(), EXIT_FAILED);
    }
    auto db = std::move(dbResult).unwrap();

    auto migrated = rollplan::storage::initialize_database(db);
    if (migrated.is_err()) {
        qCCritical(lcStore) << "schema setup failed:" << migrated.unwrap_err().message.c_str();
        return report(migrated.unwrap_err(), EXIT_FAILED);
    }

    rollplan::service::TaskService service(db);

    if (command == QStringLiteral("plan")) {
        return print(rollplan::cli::plan_command(service, {.projectId = parser.value(projectOption)}));
    }

    if (command == QStringLiteral("create")) {
        return print(rollplan::cli::create_command(service, rollplan::cli::CreateOptions{
            .projectId = parser.value(projectOption),
            .type = parser.value(typeOption),
            .title = parser.value(titleOption),
            .description = optional_value(parser, descriptionOption),
            .parentId = parser.value(parentOption),
            .notes = optional_value(parser, notesOption),
        }));
    }

    if (command == QStringLiteral("update")) {
        return print(rollplan::cli::update_command(service, rollplan::cli::UpdateOptions{
            .projectId = parser.value(projectOption),
            .itemId = parser.value(idOption),
            .assignments = parser.values(setOption),
        }));
    }

    if (command == QStringLiteral("complete")) {
        return print(rollplan::cli::complete_command(service, rollplan::cli::CompleteOptions{
            .projectId = parser.value(projectOption),
            .itemId = parser.value(idOption),
        }));
    }

    if (command == QStringLiteral("search")) {
        return print(rollplan::cli::search_command(service, rollplan::cli::SearchOptions{
            .projectId = parser.value(projectOption),
            .query = positional.join(QLatin1Char(' ')),
        }));
    }

    return print(rollplan::cli::log_command(service, rollplan::cli::LogOptions{
        .projectId = parser.value(projectOption),
        .itemId = parser.value(idOption),
        .limit = parser.value(limitOption),
    }));
}
