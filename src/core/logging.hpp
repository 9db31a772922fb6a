#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lanscoutDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(lanscoutListenerLog)
Q_DECLARE_LOGGING_CATEGORY(lanscoutProbeLog)

namespace lanscout {

struct LogOptions {
    bool debug = false;
    // Empty means stderr only.
    QString file_path;
};

// Installs a Qt message handler that stamps UTC time, level and category on
// every line, writes it to stderr and optionally appends it to a file.
void install_log_handler(const LogOptions& options);

// Turns the lanscout.* debug categories on or off.
void set_debug_logging(bool enabled);

} // namespace lanscout
