#include "DefaultsBootstrapper.hpp"

#include <QDateTime>
#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>

#include "Connection.hpp"
#include "Logger.hpp"
#include "StoreError.hpp"

DefaultsBootstrapper::DefaultsBootstrapper(Connection &connection)
    : m_connection(connection) {}

QString DefaultsBootstrapper::defaultGroupName() {
    return QStringLiteral("默认");
}

const std::vector<std::pair<QString, QString>> &DefaultsBootstrapper::defaultSettings() {
    static const std::vector<std::pair<QString, QString>> defaults = {
        {QStringLiteral("alwaysOnTop"), QStringLiteral("1")},
        {QStringLiteral("hideDone"), QStringLiteral("0")},
        {QStringLiteral("viewMode"), QStringLiteral("cards")},
        {QStringLiteral("conciseMode"), QStringLiteral("0")},
    };
    return defaults;
}

void DefaultsBootstrapper::ensureDefaults() {
    QSqlDatabase db = m_connection.database();

    if (!db.transaction()) {
        const QString detail = db.lastError().text();
        qCritical(appSql) << "tx begin:" << detail;
        throw StoreError::infrastructure(QStringLiteral("bootstrap defaults"), detail);
    }

    try {
        ensureDefaultSettings();
        ensureDefaultGroup();
    } catch (const StoreError &) {
        db.rollback();
        throw;
    }

    if (!db.commit()) {
        const QString detail = db.lastError().text();
        qCritical(appSql) << "tx commit:" << detail;
        db.rollback();
        throw StoreError::infrastructure(QStringLiteral("bootstrap defaults"), detail);
    }
}

void DefaultsBootstrapper::ensureDefaultSettings() {
    QSqlQuery query(m_connection.database());
    query.prepare(QStringLiteral("INSERT OR IGNORE INTO settings(key, value) VALUES(?, ?)"));

    for (const auto &entry : defaultSettings()) {
        query.bindValue(0, entry.first);
        query.bindValue(1, entry.second);
        if (!query.exec()) {
            const QString detail = query.lastError().text();
            qCritical(appSql) << "init setting" << entry.first << "failed:" << detail;
            throw StoreError::infrastructure(
                QStringLiteral("init setting \"%1\"").arg(entry.first), detail);
        }
        if (query.numRowsAffected() > 0) {
            qInfo(appSql) << "Seeded setting" << entry.first << "=" << entry.second;
        }
    }
}

// Tasks must belong to a group, so an empty groups table would leave
// nothing a user could add a task to.
void DefaultsBootstrapper::ensureDefaultGroup() {
    QSqlQuery count(m_connection.database());
    if (!count.exec(QStringLiteral("SELECT COUNT(1) FROM groups")) || !count.next()) {
        const QString detail = count.lastError().text();
        qCritical(appSql) << "count groups:" << detail;
        throw StoreError::infrastructure(QStringLiteral("count groups"), detail);
    }
    if (count.value(0).toLongLong() > 0) {
        return;
    }

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    QSqlQuery insert(m_connection.database());
    insert.prepare(
        QStringLiteral("INSERT INTO groups(name, created_at, updated_at) VALUES(?, ?, ?)"));
    insert.addBindValue(defaultGroupName());
    insert.addBindValue(now);
    insert.addBindValue(now);

    if (!insert.exec()) {
        const QString detail = insert.lastError().text();
        qCritical(appSql) << "create default group:" << detail;
        throw StoreError::infrastructure(QStringLiteral("create default group"), detail);
    }

    qInfo(appSql) << "Default group created id=" << insert.lastInsertId().toLongLong();
}
