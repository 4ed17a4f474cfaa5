#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QTextStream>

#include <cstdio>
#include <memory>

#include "Logger.hpp"

Q_LOGGING_CATEGORY(appCore, "quadra.core")
Q_LOGGING_CATEGORY(appSql,  "quadra.sql")

namespace {

struct LogSink {
    std::unique_ptr<QFile> file;
    bool echoToStderr = true;
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

QMutex g_sinkMutex;
LogSink g_sink;

void messageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    const QString line = qFormatLogMessage(type, ctx, msg) + '\n';

    QMutexLocker lock(&g_sinkMutex);
    if (g_sink.echoToStderr) {
        fprintf(stderr, "%s", line.toLocal8Bit().constData());
    }
    if (g_sink.file && g_sink.file->isOpen()) {
        QTextStream ts(g_sink.file.get());
        ts << line;
        ts.flush();
    }
}

} // END NAMESPACE

void initLogging(const LogOptions& options) {
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category} "
                       "(%{if-debug}%{function}:%{line}%{endif}): %{message}");
    QLoggingCategory::setFilterRules(options.verbose ? QStringLiteral("quadra.*=true")
                                                     : QStringLiteral("quadra.*.debug=false"));

    QString openError;
    bool toFile = false;
    {
        QMutexLocker lock(&g_sinkMutex);
        g_sink.echoToStderr = options.echoToStderr;
        g_sink.file.reset();
        if (!options.filePath.isEmpty()) {
            auto file = std::make_unique<QFile>(options.filePath);
            if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                g_sink.file = std::move(file);
            } else {
                openError = file->errorString();
                g_sink.echoToStderr = true;
            }
        }
        if (!g_sink.installed) {
            g_sink.previous = qInstallMessageHandler(messageHandler);
            g_sink.installed = true;
        }
        toFile = static_cast<bool>(g_sink.file);
    }

    if (!openError.isEmpty()) {
        qWarning(appCore) << "Failed to open log file:" << options.filePath << "|" << openError;
    }
    qInfo(appCore) << "Logging initialized"
                   << (toFile ? QString("-> %1").arg(options.filePath)
                              : QString("(stderr only)"))
                   << "| verbose=" << options.verbose;
}

void shutdownLogging() {
    QMutexLocker lock(&g_sinkMutex);
    if (!g_sink.installed) {
        return;
    }
    qInstallMessageHandler(g_sink.previous);
    g_sink.previous = nullptr;
    g_sink.installed = false;
    if (g_sink.file) {
        g_sink.file->flush();
        g_sink.file.reset();
    }
    g_sink.echoToStderr = true;
}
