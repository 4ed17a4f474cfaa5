#include "GroupRepository.hpp"

#include <QDateTime>
#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include <QtSql/QSqlRecord>

#include "Connection.hpp"
#include "Logger.hpp"
#include "StoreError.hpp"
#include "TextUtils.hpp"

namespace {

Group rowToGroup(const QSqlRecord &record) {
    Group group;
    group.id = record.value("id").toLongLong();
    group.name = record.value("name").toString();
    group.createdAt = record.value("created_at").toLongLong();
    group.updatedAt = record.value("updated_at").toLongLong();
    return group;
}

QString notFoundMessage(qint64 id) {
    return QStringLiteral("group not found (id=%1)").arg(id);
}

} // END NAMESPACE

GroupRepository::GroupRepository(Connection &connection) : m_connection(connection) {}

std::vector<Group> GroupRepository::list() const {
    std::vector<Group> out;

    QSqlQuery query(m_connection.database());
    if (!query.exec(QStringLiteral(
            "SELECT id, name, created_at, updated_at FROM groups ORDER BY id ASC"))) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "list groups:" << detail;
        throw StoreError::infrastructure(QStringLiteral("list groups"), detail);
    }

    while (query.next()) {
        out.push_back(rowToGroup(query.record()));
    }

    qDebug(appSql) << "→" << out.size() << "groups fetched";
    return out;
}

std::optional<Group> GroupRepository::get(qint64 id) const {
    QSqlQuery query(m_connection.database());
    query.prepare(QStringLiteral(
        "SELECT id, name, created_at, updated_at FROM groups WHERE id = ?"));
    query.addBindValue(id);

    if (!query.exec()) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "get group:" << detail;
        throw StoreError::infrastructure(QStringLiteral("get group"), detail);
    }
    if (!query.next()) {
        return std::nullopt;
    }
    return rowToGroup(query.record());
}

bool GroupRepository::exists(qint64 id) const {
    QSqlQuery query(m_connection.database());
    query.prepare(QStringLiteral("SELECT 1 FROM groups WHERE id = ?"));
    query.addBindValue(id);

    if (!query.exec()) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "check group exists:" << detail;
        throw StoreError::infrastructure(QStringLiteral("check group exists"), detail);
    }
    return query.next();
}

Group GroupRepository::upsert(qint64 id, const QString &rawName) {
    const QString name = rawName.trimmed();
    if (name.isEmpty()) {
        qWarning(appSql) << "Rejected group with empty name";
        throw StoreError::validation(QStringLiteral("group name must not be empty"));
    }
    if (codePointCount(name) > kMaxNameLength) {
        qWarning(appSql) << "Rejected group name of" << codePointCount(name) << "characters";
        throw StoreError::validation(
            QStringLiteral("group name is too long (max %1 characters)").arg(kMaxNameLength));
    }
    if (id < 0) {
        throw StoreError::validation(QStringLiteral("invalid group id"));
    }

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    QSqlQuery query(m_connection.database());

    if (id == 0) {
        query.prepare(QStringLiteral(
            "INSERT INTO groups(name, created_at, updated_at) VALUES(?, ?, ?)"));
        query.addBindValue(name);
        query.addBindValue(now);
        query.addBindValue(now);

        if (!query.exec()) {
            if (isUniqueViolation(query.lastError())) {
                qWarning(appSql) << "Duplicate group name" << name;
                throw StoreError::conflict(QStringLiteral("group name already exists"));
            }
            const QString detail = query.lastError().text();
            qCritical(appSql) << "create group:" << detail;
            throw StoreError::infrastructure(QStringLiteral("create group"), detail);
        }

        Group group;
        group.id = query.lastInsertId().toLongLong();
        group.name = name;
        group.createdAt = now;
        group.updatedAt = now;
        qInfo(appSql) << "Group inserted id=" << group.id << "name=" << name;
        return group;
    }

    query.prepare(QStringLiteral("UPDATE groups SET name = ?, updated_at = ? WHERE id = ?"));
    query.addBindValue(name);
    query.addBindValue(now);
    query.addBindValue(id);

    if (!query.exec()) {
        if (isUniqueViolation(query.lastError())) {
            qWarning(appSql) << "Duplicate group name" << name << "for id=" << id;
            throw StoreError::conflict(QStringLiteral("group name already exists"));
        }
        const QString detail = query.lastError().text();
        qCritical(appSql) << "update group:" << detail;
        throw StoreError::infrastructure(QStringLiteral("update group"), detail);
    }
    if (query.numRowsAffected() == 0) {
        qInfo(appSql) << "No rows updated for group id=" << id;
        throw StoreError::notFound(notFoundMessage(id));
    }

    const auto reloaded = get(id);
    if (!reloaded) {
        throw StoreError::infrastructure(QStringLiteral("reload group"),
                                         notFoundMessage(id));
    }
    qInfo(appSql) << "Group updated id=" << id << "name=" << name;
    return *reloaded;
}

void GroupRepository::remove(qint64 id) {
    if (id <= 0) {
        qWarning(appSql) << "Rejected group delete with id=" << id;
        throw StoreError::validation(QStringLiteral("invalid group id"));
    }

    QSqlQuery query(m_connection.database());
    query.prepare(QStringLiteral("DELETE FROM groups WHERE id = ?"));
    query.addBindValue(id);

    if (!query.exec()) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "delete group:" << detail;
        throw StoreError::infrastructure(QStringLiteral("delete group"), detail);
    }
    if (query.numRowsAffected() == 0) {
        qInfo(appSql) << "Not found group id=" << id;
        throw StoreError::notFound(notFoundMessage(id));
    }

    qInfo(appSql) << "Group deleted id=" << id;
}
