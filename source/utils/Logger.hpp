#ifndef QUADRA_UTILS_LOGGER_HPP
#define QUADRA_UTILS_LOGGER_HPP

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

Q_DECLARE_LOGGING_CATEGORY(appCore)
Q_DECLARE_LOGGING_CATEGORY(appSql)

struct LogOptions {
    QString filePath;      // empty: stderr only
    bool verbose = false;  // enables quadra.* debug output
    bool echoToStderr = true;
};

// Installs the quadra message handler. Calling it again replaces the sink.
void initLogging(const LogOptions& options = LogOptions());

// Flushes and closes the log file, restores the previous handler.
void shutdownLogging();

#endif // QUADRA_UTILS_LOGGER_HPP
