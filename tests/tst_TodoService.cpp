#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <memory>

#include "ErrorHandler.hpp"
#include "StoreTestUtils.hpp"
#include "TodoServiceImpl.hpp"

class TodoServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void callsBeforeStartAreNotReady();
    void failedStartIsRemembered();
    void failedStartFailsTheStartStep();
    void boardAggregatesEverything();
    void boardJsonShape();
    void toggleDoneFlipsBetweenDoneAndTodo();
    void toggleMissingTask();
    void settingSettersReturnUpdatedSettings();
    void reminderThrottle();
    void shutdownClosesStore();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<TodoServiceImpl> m_service;
};

void TodoServiceTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_service = std::make_unique<TodoServiceImpl>();
}

void TodoServiceTest::cleanup()
{
    m_service.reset();
    m_dir.reset();
}

void TodoServiceTest::callsBeforeStartAreNotReady()
{
    QVERIFY(!m_service->isReady());

    const auto err = captureError([this] { m_service->board(); });
    QVERIFY(err);
    QVERIFY(err->kind() == StoreError::Kind::Infrastructure);
    QCOMPARE(err->message(), QStringLiteral("application is not initialized yet"));
}

void TodoServiceTest::failedStartIsRemembered()
{
    QVERIFY(!m_service->start(QString()));

    const auto err = captureError([this] { m_service->upsertGroup(0, "Work"); });
    QVERIFY(err);
    QVERIFY(err->kind() == StoreError::Kind::Infrastructure);
    QVERIFY(err->message().startsWith("initialization failed"));

    // A later successful start clears the remembered failure.
    QVERIFY(m_service->start(m_dir->filePath("todo.db")));
    QCOMPARE(m_service->upsertGroup(0, "Work").name, QStringLiteral("Work"));
}

void TodoServiceTest::failedStartFailsTheStartStep()
{
    QVERIFY(!m_service->startupError());

    const QJsonObject started = wrapSafe("start", [this]() {
        if (!m_service->start(QString())) {
            throw *m_service->startupError();
        }
        return makeApiOk();
    });

    QCOMPARE(started.value("ok").toBool(), false);
    QCOMPARE(started.value("type").toString(), QStringLiteral("not_ready"));
    QVERIFY(m_service->startupError());
    QVERIFY(m_service->startupError()->message().startsWith("initialization failed"));

    QVERIFY(m_service->start(m_dir->filePath("todo.db")));
    QVERIFY(!m_service->startupError());
}

void TodoServiceTest::boardAggregatesEverything()
{
    QVERIFY(m_service->start(m_dir->filePath("todo.db")));

    const Group group = m_service->upsertGroup(0, "Errands");
    Task task;
    task.groupId = group.id;
    task.title = "Buy milk";
    m_service->upsertTask(task);

    const Board board = m_service->board();
    QCOMPARE(board.groups.size(), size_t(2));
    QCOMPARE(board.tasks.size(), size_t(1));
    QCOMPARE(board.tasks.front().groupId, group.id);
    QVERIFY(board.settings == Settings());
    QCOMPARE(board.statuses.size(), qsizetype(3));
    QVERIFY(board.statuses.front() == Status::Todo);
}

void TodoServiceTest::boardJsonShape()
{
    QVERIFY(m_service->start(m_dir->filePath("todo.db")));

    const QJsonObject json = m_service->board().toJson();
    QVERIFY(json.value("groups").isArray());
    QVERIFY(json.value("tasks").isArray());
    QVERIFY(json.value("statuses").toArray() == (QJsonArray{"todo", "doing", "done"}));

    const QJsonObject settings = json.value("settings").toObject();
    QCOMPARE(settings.value("viewMode").toString(), QStringLiteral("cards"));
    QCOMPARE(settings.value("alwaysOnTop").toBool(), true);

    const QJsonObject group = json.value("groups").toArray().first().toObject();
    QVERIFY(group.contains("createdAt"));
    QVERIFY(group.contains("updatedAt"));
}

void TodoServiceTest::toggleDoneFlipsBetweenDoneAndTodo()
{
    QVERIFY(m_service->start(m_dir->filePath("todo.db")));

    Task task;
    task.groupId = m_service->board().groups.front().id;
    task.title = "Ship it";
    task.status = "doing";
    task.important = true;
    const Task stored = m_service->upsertTask(task);

    const Task done = m_service->toggleDone(stored.id);
    QCOMPARE(done.status, QStringLiteral("done"));
    QVERIFY(done.important);

    // Unchecking goes back to "todo", not to the earlier "doing".
    const Task reopened = m_service->toggleDone(stored.id);
    QCOMPARE(reopened.status, QStringLiteral("todo"));
}

void TodoServiceTest::toggleMissingTask()
{
    QVERIFY(m_service->start(m_dir->filePath("todo.db")));

    const auto err = captureError([this] { m_service->toggleDone(404); });
    QVERIFY(err);
    QVERIFY(err->kind() == StoreError::Kind::NotFound);
}

void TodoServiceTest::settingSettersReturnUpdatedSettings()
{
    QVERIFY(m_service->start(m_dir->filePath("todo.db")));

    QVERIFY(m_service->setHideDone(true).hideDone);
    QVERIFY(!m_service->setAlwaysOnTop(false).alwaysOnTop);
    QVERIFY(m_service->setConciseMode(true).conciseMode);
    QCOMPARE(m_service->setViewMode("list").viewMode, QStringLiteral("list"));
    QCOMPARE(m_service->setViewMode("grid").viewMode, QStringLiteral("cards"));
    QCOMPARE(m_service->setTheme("dark").theme, QStringLiteral("dark"));

    const Settings stored = m_service->settings();
    QVERIFY(stored.hideDone);
    QVERIFY(!stored.alwaysOnTop);
    QVERIFY(stored.conciseMode);
    QCOMPARE(stored.viewMode, QStringLiteral("cards"));
    QCOMPARE(stored.theme, QStringLiteral("dark"));
}

void TodoServiceTest::reminderThrottle()
{
    QVERIFY(m_service->start(m_dir->filePath("todo.db")));

    const qint64 now = 1700000000000;
    QVERIFY(m_service->shouldShowReminder(now));

    m_service->markReminderShown(now);
    QVERIFY(!m_service->shouldShowReminder(now + 1000));
    QVERIFY(!m_service->shouldShowReminder(now + TodoServiceImpl::kReminderIntervalMs - 1));
    QVERIFY(m_service->shouldShowReminder(now + TodoServiceImpl::kReminderIntervalMs));
}

void TodoServiceTest::shutdownClosesStore()
{
    const QString path = m_dir->filePath("todo.db");
    QVERIFY(m_service->start(path));
    m_service->shutdown();
    m_service->shutdown();
    QVERIFY(!m_service->isReady());

    // The file is free again for a new owner.
    TodoServiceImpl other;
    QVERIFY(other.start(path));
    QCOMPARE(other.board().groups.size(), size_t(1));
}

QTEST_MAIN(TodoServiceTest)
#include "tst_TodoService.moc"
