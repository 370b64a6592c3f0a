#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcCli)

namespace rollplan::cli {

// Installs a Qt message handler that appends to log_file_path. stdout is
// reserved for command output, so nothing goes to the console unless
// mirror_to_stderr is set.
void install_file_logging(const QString& log_file_path, bool mirror_to_stderr);

// Enables or silences debug output of the rollplan.* categories.
void set_debug_logging(bool enabled);

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

} // namespace rollplan::cli
