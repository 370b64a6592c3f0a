#pragma once

#include <QString>

#include <optional>

#include "core/result.hpp"
#include "storage/database.hpp"

namespace rollplan::cli {

// Values given on the command line; unset members fall back to the
// environment and then to defaults.
struct ConfigOverrides {
    std::optional<QString> databasePath;
    std::optional<QString> logFilePath;
    std::optional<QString> busyTimeoutMs;
    bool verbose = false;
    bool debug = false;
};

struct CliConfig {
    QString databasePath;
    QString logFilePath;
    int busyTimeoutMs = 2000;
    bool verbose = false;
    bool debug = false;
};

// Environment variables consulted by resolve_config.
inline constexpr const char* ENV_DB_PATH = "ROLLPLAN_DB_PATH";
inline constexpr const char* ENV_LOG_FILE = "ROLLPLAN_LOG_FILE";
inline constexpr const char* ENV_BUSY_TIMEOUT_MS = "ROLLPLAN_BUSY_TIMEOUT_MS";

[[nodiscard]] QString default_database_path();

// Command line, then environment, then defaults. A busy timeout that is
// not a non-negative integer fails with InvalidArgument.
[[nodiscard]] Result<CliConfig> resolve_config(const ConfigOverrides& overrides);

[[nodiscard]] storage::StoreOptions store_options(const CliConfig& config);

} // namespace rollplan::cli
