#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>
#include <memory>

#include "Logger.hpp"

class LoggerTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void writesCategorisedLinesToFile();
    void debugOutputNeedsVerbose();
    void unopenableFileFallsBackToStderr();
    void shutdownIsIdempotent();

private:
    QString readLog() const;
    QString logPath() const { return m_dir->filePath("quadra.log"); }

    std::unique_ptr<QTemporaryDir> m_dir;
};

void LoggerTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void LoggerTest::cleanup()
{
    shutdownLogging();
    m_dir.reset();
}

QString LoggerTest::readLog() const
{
    QFile file(logPath());
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return QString();
    return QString::fromUtf8(file.readAll());
}

void LoggerTest::writesCategorisedLinesToFile()
{
    LogOptions options;
    options.filePath = logPath();
    options.echoToStderr = false;
    initLogging(options);

    qInfo(appCore) << "board fetched";
    qWarning(appSql) << "slow statement";
    shutdownLogging();

    const QString log = readLog();
    QVERIFY(log.contains("Logging initialized"));
    QVERIFY(log.contains("quadra.core"));
    QVERIFY(log.contains("board fetched"));
    QVERIFY(log.contains("quadra.sql"));
    QVERIFY(log.contains("slow statement"));
}

void LoggerTest::debugOutputNeedsVerbose()
{
    LogOptions options;
    options.filePath = logPath();
    options.echoToStderr = false;
    initLogging(options);
    qCDebug(appSql) << "hidden statement";

    options.verbose = true;
    initLogging(options);
    qCDebug(appSql) << "visible statement";
    shutdownLogging();

    const QString log = readLog();
    QVERIFY(!log.contains("hidden statement"));
    QVERIFY(log.contains("visible statement"));
}

void LoggerTest::unopenableFileFallsBackToStderr()
{
    LogOptions options;
    options.filePath = m_dir->filePath("missing/dir/quadra.log");
    options.echoToStderr = false;
    initLogging(options);
    qInfo(appCore) << "still logging";
    shutdownLogging();

    QVERIFY(!QFile::exists(options.filePath));
}

void LoggerTest::shutdownIsIdempotent()
{
    LogOptions options;
    options.filePath = logPath();
    options.echoToStderr = false;
    initLogging(options);
    shutdownLogging();
    shutdownLogging();

    qInfo(appCore) << "after shutdown";
    QVERIFY(!readLog().contains("after shutdown"));
}

QTEST_MAIN(LoggerTest)
#include "tst_Logger.moc"
