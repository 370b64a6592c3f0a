#include "cli/config.hpp"
#include "cli/logging.hpp"

#include <QDir>
#include <QStandardPaths>
#include <QtGlobal>

namespace rollplan::cli {

namespace {

[[nodiscard]] std::optional<QString> from_env(const char* name) {
    if (qEnvironmentVariableIsEmpty(name)) {
        return std::nullopt;
    }
    return qEnvironmentVariable(name);
}

[[nodiscard]] std::optional<QString> first_of(const std::optional<QString>& cli, const char* env) {
    if (cli && !cli->isEmpty()) {
        return cli;
    }
    return from_env(env);
}

} // namespace

QString default_database_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QStringLiteral("rollplan.db");
    }
    return QDir(base).filePath(QStringLiteral("rollplan.db"));
}

Result<CliConfig> resolve_config(const ConfigOverrides& overrides) {
    CliConfig config;
    config.verbose = overrides.verbose;
    config.debug = overrides.debug;
    config.databasePath = first_of(overrides.databasePath, ENV_DB_PATH).value_or(default_database_path());
    config.logFilePath = first_of(overrides.logFilePath, ENV_LOG_FILE).value_or(default_log_file_path());

    if (const auto timeout = first_of(overrides.busyTimeoutMs, ENV_BUSY_TIMEOUT_MS)) {
        bool ok = false;
        const int value = timeout->trimmed().toInt(&ok);
        if (!ok || value < 0) {
            return Result<CliConfig>::err(Error::invalid_argument(
                "Busy timeout must be a non-negative integer, got: " + timeout->toStdString()));
        }
        config.busyTimeoutMs = value;
    }

    return Result<CliConfig>::ok(std::move(config));
}

storage::StoreOptions store_options(const CliConfig& config) {
    return storage::StoreOptions{
        .path = config.databasePath.toStdString(),
        .busy_timeout_ms = config.busyTimeoutMs,
    };
}

} // namespace rollplan::cli
