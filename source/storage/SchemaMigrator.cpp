#include "SchemaMigrator.hpp"

#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>

#include "Connection.hpp"
#include "Logger.hpp"
#include "StoreError.hpp"

SchemaMigrator::SchemaMigrator(Connection &connection) : m_connection(connection) {}

const std::vector<MigrationStep> &SchemaMigrator::steps() {
    static const std::vector<MigrationStep> all = {
        {QStringLiteral("create groups"),
         QStringLiteral("CREATE TABLE IF NOT EXISTS groups ("
                        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
                        "  name TEXT NOT NULL UNIQUE,"
                        "  created_at INTEGER NOT NULL,"
                        "  updated_at INTEGER NOT NULL"
                        ")"),
         {}, {}},
        {QStringLiteral("create tasks"),
         QStringLiteral("CREATE TABLE IF NOT EXISTS tasks ("
                        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
                        "  group_id INTEGER NOT NULL REFERENCES groups(id) ON DELETE CASCADE,"
                        "  title TEXT NOT NULL,"
                        "  content TEXT NOT NULL DEFAULT '',"
                        "  status TEXT NOT NULL CHECK (status IN ('todo','doing','done')),"
                        "  important INTEGER NOT NULL DEFAULT 0 CHECK (important IN (0,1)),"
                        "  urgent INTEGER NOT NULL DEFAULT 0 CHECK (urgent IN (0,1)),"
                        "  created_at INTEGER NOT NULL,"
                        "  updated_at INTEGER NOT NULL"
                        ")"),
         {}, {}},
        {QStringLiteral("create tasks group/status index"),
         QStringLiteral("CREATE INDEX IF NOT EXISTS idx_tasks_group_status "
                        "ON tasks(group_id, status)"),
         {}, {}},
        {QStringLiteral("create settings"),
         QStringLiteral("CREATE TABLE IF NOT EXISTS settings ("
                        "  key TEXT PRIMARY KEY,"
                        "  value TEXT NOT NULL"
                        ")"),
         {}, {}},
        // Files written before priority flags existed.
        {QStringLiteral("add tasks.important"),
         QStringLiteral("ALTER TABLE tasks ADD COLUMN important INTEGER NOT NULL "
                        "DEFAULT 0 CHECK (important IN (0,1))"),
         QStringLiteral("tasks"), QStringLiteral("important")},
        {QStringLiteral("add tasks.urgent"),
         QStringLiteral("ALTER TABLE tasks ADD COLUMN urgent INTEGER NOT NULL "
                        "DEFAULT 0 CHECK (urgent IN (0,1))"),
         QStringLiteral("tasks"), QStringLiteral("urgent")},
        {QStringLiteral("create tasks important/urgent index"),
         QStringLiteral("CREATE INDEX IF NOT EXISTS idx_tasks_important_urgent "
                        "ON tasks(important, urgent)"),
         {}, {}},
    };
    return all;
}

QSet<QString> SchemaMigrator::columnsOf(const QString &table) const {
    QSet<QString> columns;

    QSqlQuery query(m_connection.database());
    if (!query.exec(QStringLiteral("PRAGMA table_info(%1)").arg(table))) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "read schema of" << table << "failed:" << detail;
        throw StoreError::infrastructure(QStringLiteral("read %1 schema").arg(table), detail);
    }

    // cid, name, type, notnull, dflt_value, pk
    while (query.next()) {
        columns.insert(query.value(1).toString());
    }
    return columns;
}

void SchemaMigrator::migrate() {
    qInfo(appSql) << "Ensuring DB schema...";

    int applied = 0;
    for (const MigrationStep &step : steps()) {
        if (!step.column.isEmpty() && columnsOf(step.table).contains(step.column)) {
            qDebug(appSql) << "skip:" << step.description;
            continue;
        }

        m_connection.exec(step.sql, QStringLiteral("migrate (%1)").arg(step.description));
        if (!step.column.isEmpty()) {
            qInfo(appSql) << "Upgraded schema:" << step.description;
        }
        ++applied;
    }

    qInfo(appSql) << "Schema OK," << applied << "statements run";
}
