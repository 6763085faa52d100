#pragma once

#include <QString>

namespace folio::util {

/**
 * Routes Qt messages to a log file as "timestamp level category message"
 * lines. An empty path selects default_log_file_path(). Messages are also
 * echoed to stderr at warning level and above, or at every level when
 * `echo_all` is set.
 */
void install_file_logging(const QString& path = {}, bool echo_all = false);

// Default log file path under AppLocalData (may be empty if unavailable).
QString default_log_file_path();

// Enables folio.*.debug output, which Qt hides by default.
void enable_debug_categories();

} // namespace folio::util
