#include <QtTest/QtTest>

#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QTemporaryDir>
#include <QVariant>
#include <QtSql/QSqlQuery>
#include <memory>

#include "Connection.hpp"
#include "DefaultsBootstrapper.hpp"
#include "SQLiteStorage.hpp"
#include "SchemaMigrator.hpp"
#include "StoreTestUtils.hpp"

class SchemaMigratorTest : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void freshStoreHasFullSchema();
    void sessionPragmasAreApplied();
    void migrateTwiceIsNoop();
    void legacyTasksTableGainsPriorityColumns();
    void bootstrapIsIdempotent();
    void defaultGroupReturnsWhenAllGroupsDeleted();
    void emptyPathFails();
    void secondOpenOfSameFileFails();
    void closeIsIdempotent();
    void corruptFileFailsOpen();

private:
    QString dbPath() const { return m_dir->filePath("todo.db"); }
    static int countRows(Connection &connection, const QString &sql);

    std::unique_ptr<QTemporaryDir> m_dir;
};

void SchemaMigratorTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

int SchemaMigratorTest::countRows(Connection &connection, const QString &sql)
{
    QSqlQuery query(connection.database());
    if (!query.exec(sql) || !query.next()) {
        return -1;
    }
    return query.value(0).toInt();
}

void SchemaMigratorTest::freshStoreHasFullSchema()
{
    {
        SQLiteStorage storage(dbPath());
    }

    Connection connection(dbPath());
    SchemaMigrator migrator(connection);

    const QSet<QString> expected{"id", "group_id", "title", "content", "status",
                                 "important", "urgent", "created_at", "updated_at"};
    QVERIFY(migrator.columnsOf("tasks") == expected);
    QVERIFY(migrator.columnsOf("groups") ==
            (QSet<QString>{"id", "name", "created_at", "updated_at"}));
    QVERIFY(migrator.columnsOf("settings") == (QSet<QString>{"key", "value"}));

    QCOMPARE(countRows(connection,
                       "SELECT COUNT(*) FROM sqlite_master WHERE type = 'index' AND name IN "
                       "('idx_tasks_group_status', 'idx_tasks_important_urgent')"),
             2);
}

void SchemaMigratorTest::sessionPragmasAreApplied()
{
    Connection connection(dbPath());
    QCOMPARE(countRows(connection, "PRAGMA foreign_keys"), 1);
    QCOMPARE(countRows(connection, "PRAGMA busy_timeout"), Connection::kBusyTimeoutMs);

    QSqlQuery query(connection.database());
    QVERIFY(query.exec("PRAGMA journal_mode"));
    QVERIFY(query.next());
    QCOMPARE(query.value(0).toString(), QStringLiteral("wal"));
}

void SchemaMigratorTest::migrateTwiceIsNoop()
{
    Connection connection(dbPath());
    SchemaMigrator migrator(connection);

    migrator.migrate();
    const QSet<QString> first = migrator.columnsOf("tasks");
    const int objects =
        countRows(connection, "SELECT COUNT(*) FROM sqlite_master WHERE name NOT LIKE 'sqlite_%'");

    migrator.migrate();
    QVERIFY(migrator.columnsOf("tasks") == first);
    QCOMPARE(countRows(connection,
                       "SELECT COUNT(*) FROM sqlite_master WHERE name NOT LIKE 'sqlite_%'"),
             objects);
}

void SchemaMigratorTest::legacyTasksTableGainsPriorityColumns()
{
    {
        Connection connection(dbPath());
        connection.exec("CREATE TABLE groups ("
                        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
                        "  name TEXT NOT NULL UNIQUE,"
                        "  created_at INTEGER NOT NULL,"
                        "  updated_at INTEGER NOT NULL)",
                        "legacy groups");
        connection.exec("CREATE TABLE tasks ("
                        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
                        "  group_id INTEGER NOT NULL REFERENCES groups(id) ON DELETE CASCADE,"
                        "  title TEXT NOT NULL,"
                        "  content TEXT NOT NULL DEFAULT '',"
                        "  status TEXT NOT NULL CHECK (status IN ('todo','doing','done')),"
                        "  created_at INTEGER NOT NULL,"
                        "  updated_at INTEGER NOT NULL)",
                        "legacy tasks");
        connection.exec("INSERT INTO groups(name, created_at, updated_at) VALUES('Old', 10, 10)",
                        "legacy group row");
        connection.exec("INSERT INTO tasks(group_id, title, content, status, created_at, updated_at) "
                        "VALUES(1, 'Carry over', 'notes', 'doing', 20, 30)",
                        "legacy task row");

        SchemaMigrator migrator(connection);
        QVERIFY(!migrator.columnsOf("tasks").contains("important"));
        migrator.migrate();
        QVERIFY(migrator.columnsOf("tasks").contains("important"));
        QVERIFY(migrator.columnsOf("tasks").contains("urgent"));
    }

    SQLiteStorage storage(dbPath());
    const auto tasks = storage.listTasks();
    QCOMPARE(tasks.size(), size_t(1));
    QCOMPARE(tasks.front().title, QStringLiteral("Carry over"));
    QCOMPARE(tasks.front().content, QStringLiteral("notes"));
    QCOMPARE(tasks.front().status, QStringLiteral("doing"));
    QCOMPARE(tasks.front().createdAt, qint64(20));
    QCOMPARE(tasks.front().updatedAt, qint64(30));
    QVERIFY(!tasks.front().important);
    QVERIFY(!tasks.front().urgent);

    // The legacy group already existed, so no default group is added.
    QCOMPARE(storage.listGroups().size(), size_t(1));
}

void SchemaMigratorTest::bootstrapIsIdempotent()
{
    {
        SQLiteStorage storage(dbPath());
        QCOMPARE(storage.listGroups().size(), size_t(1));
        QCOMPARE(storage.listGroups().front().name, DefaultsBootstrapper::defaultGroupName());

        Settings settings = storage.getSettings();
        settings.alwaysOnTop = false;
        settings.viewMode = "list";
        storage.setSettings(settings);
    }

    SQLiteStorage storage(dbPath());
    QCOMPARE(storage.listGroups().size(), size_t(1));
    QVERIFY(!storage.getSettings().alwaysOnTop);
    QCOMPARE(storage.getSettings().viewMode, QStringLiteral("list"));
}

void SchemaMigratorTest::defaultGroupReturnsWhenAllGroupsDeleted()
{
    {
        SQLiteStorage storage(dbPath());
        storage.deleteGroup(storage.listGroups().front().id);
        QVERIFY(storage.listGroups().empty());
    }

    SQLiteStorage storage(dbPath());
    QCOMPARE(storage.listGroups().size(), size_t(1));
}

void SchemaMigratorTest::emptyPathFails()
{
    const auto err = captureError([] { SQLiteStorage storage("   "); });
    QVERIFY(err);
    QVERIFY(err->kind() == StoreError::Kind::Infrastructure);
}

void SchemaMigratorTest::secondOpenOfSameFileFails()
{
    SQLiteStorage first(dbPath());

    const auto err = captureError([this] { SQLiteStorage second(dbPath()); });
    QVERIFY(err);
    QVERIFY(err->kind() == StoreError::Kind::Infrastructure);
    QVERIFY(err->message().contains("already open"));

    // The rejected attempt must not disturb the live connection.
    QCOMPARE(first.listGroups().size(), size_t(1));

    first.close();
    SQLiteStorage reopened(dbPath());
    QVERIFY(reopened.isOpen());
}

void SchemaMigratorTest::closeIsIdempotent()
{
    SQLiteStorage storage(dbPath());
    storage.close();
    storage.close();
    QVERIFY(!storage.isOpen());

    const auto err = captureError([&storage] { storage.listGroups(); });
    QVERIFY(err);
    QVERIFY(err->kind() == StoreError::Kind::Infrastructure);
}

void SchemaMigratorTest::corruptFileFailsOpen()
{
    QFile file(dbPath());
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(QByteArray(8192, 'x'));
    file.close();

    const auto err = captureError([this] { SQLiteStorage storage(dbPath()); });
    QVERIFY(err);
    QVERIFY(err->kind() == StoreError::Kind::Infrastructure);

    // Nothing is left registered for the failed path.
    QVERIFY(!QSqlDatabase::contains("quadra:" + QFileInfo(dbPath()).absoluteFilePath()));
}

QTEST_MAIN(SchemaMigratorTest)
#include "tst_SchemaMigrator.moc"
