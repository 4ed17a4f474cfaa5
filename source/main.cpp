#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "ErrorHandler.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"
#include "SQLiteStorage.hpp"
#include "TaskPatch.hpp"
#include "TodoServiceImpl.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

qint64 parseId(const QString &text) {
    bool ok = false;
    const qint64 id = text.toLongLong(&ok);
    if (!ok) {
        throw StoreError::validation(QStringLiteral("not a number: \"%1\"").arg(text));
    }
    return id;
}

bool parseFlag(const QString &text) {
    const QString v = text.trimmed().toLower();
    if (v == QLatin1String("1") || v == QLatin1String("true") || v == QLatin1String("on")) {
        return true;
    }
    if (v == QLatin1String("0") || v == QLatin1String("false") || v == QLatin1String("off")) {
        return false;
    }
    throw StoreError::validation(QStringLiteral("expected a boolean, got \"%1\"").arg(text));
}

QJsonObject runCommand(TodoServiceImpl &service, const QString &command,
                       const QStringList &args) {
    if (command == QLatin1String("board")) {
        return makeApiOk(QStringLiteral("Board fetched"), service.board().toJson());
    }
    if (command == QLatin1String("settings")) {
        return makeApiOk(QStringLiteral("Settings fetched"), service.settings().toJson());
    }
    if (command == QLatin1String("group-add")) {
        const Group group = service.upsertGroup(0, args.value(0));
        return makeApiOk(QStringLiteral("Group created"), group.toJson());
    }
    if (command == QLatin1String("group-rename")) {
        const Group group = service.upsertGroup(parseId(args.value(0)), args.value(1));
        return makeApiOk(QStringLiteral("Group renamed"), group.toJson());
    }
    if (command == QLatin1String("group-rm")) {
        service.deleteGroup(parseId(args.value(0)));
        return makeApiOk(QStringLiteral("Group deleted"));
    }
    if (command == QLatin1String("task-add")) {
        Task task;
        task.groupId = parseId(args.value(0));
        task.title = args.value(1);
        task.content = args.value(2);
        return makeApiOk(QStringLiteral("Task created"), service.upsertTask(task).toJson());
    }
    if (command == QLatin1String("task-save")) {
        QString parseError;
        const auto payload = parseObject(args.value(0).toUtf8(), &parseError);
        if (!payload) {
            throw StoreError::validation(QStringLiteral("invalid JSON: ") + parseError);
        }

        Task task = Task::fromJson(*payload);
        if (task.id > 0) {
            // Keys missing from the payload keep their stored values.
            const auto existing = service.task(task.id);
            if (!existing) {
                throw StoreError::notFound(QStringLiteral("task not found (id=%1)").arg(task.id));
            }
            task = *existing;
            applyTaskPatch(task, *payload);
        }
        return makeApiOk(QStringLiteral("Task saved"), service.upsertTask(task).toJson());
    }
    if (command == QLatin1String("task-toggle")) {
        const Task task = service.toggleDone(parseId(args.value(0)));
        return makeApiOk(QStringLiteral("Task toggled"), task.toJson());
    }
    if (command == QLatin1String("task-rm")) {
        service.deleteTask(parseId(args.value(0)));
        return makeApiOk(QStringLiteral("Task deleted"));
    }
    if (command == QLatin1String("set")) {
        const QString key = args.value(0);
        const QString value = args.value(1);
        Settings updated;
        if (key == QLatin1String("hideDone")) {
            updated = service.setHideDone(parseFlag(value));
        } else if (key == QLatin1String("alwaysOnTop")) {
            updated = service.setAlwaysOnTop(parseFlag(value));
        } else if (key == QLatin1String("viewMode")) {
            updated = service.setViewMode(value);
        } else if (key == QLatin1String("conciseMode")) {
            updated = service.setConciseMode(parseFlag(value));
        } else if (key == QLatin1String("theme")) {
            updated = service.setTheme(value);
        } else {
            throw StoreError::validation(QStringLiteral("unknown setting \"%1\"").arg(key));
        }
        return makeApiOk(QStringLiteral("Settings saved"), updated.toJson());
    }

    return makeApiError(QStringLiteral("bad_request"),
                        QStringLiteral("unknown command \"%1\"").arg(command));
}

} // END NAMESPACE

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("Quadra"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Local task board store"));
    parser.addHelpOption();
    const QCommandLineOption dbOption(QStringLiteral("db"),
                                      QStringLiteral("Database file."), QStringLiteral("path"));
    const QCommandLineOption logOption(QStringLiteral("log"),
                                       QStringLiteral("Append log lines to this file."),
                                       QStringLiteral("file"));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"),
                                           QStringLiteral("Enable debug logging."));
    parser.addOption(dbOption);
    parser.addOption(logOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("board | settings | group-add | group-rename | "
                                                "group-rm | task-add | task-save | task-toggle | "
                                                "task-rm | set"));
    parser.process(app);

    LogOptions logOptions;
    logOptions.filePath = parser.value(logOption);
    logOptions.verbose = parser.isSet(verboseOption);
    initLogging(logOptions);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(kExitUsage);
    }
    const QString command = args.takeFirst();

    // ──────────────────────────────
    // 1. Resolve the database
    // ──────────────────────────────
    TodoServiceImpl service;
    const QJsonObject started = wrapSafe("start", [&]() {
        const QString dbPath = parser.isSet(dbOption) ? parser.value(dbOption)
                                                      : defaultDatabasePath(QStringLiteral("Quadra"));
        if (!service.start(dbPath)) {
            throw *service.startupError();
        }
        return makeApiOk();
    });

    // ──────────────────────────────
    // 2. Run the command
    // ──────────────────────────────
    const QJsonObject result = started.value("ok").toBool()
                                   ? wrapSafe(command.toUtf8().constData(),
                                              [&]() { return runCommand(service, command, args); })
                                   : started;

    service.shutdown();
    shutdownLogging();

    QTextStream(stdout) << toCompactJson(result) << '\n';
    return result.value("ok").toBool() ? kExitOk : kExitError;
}
