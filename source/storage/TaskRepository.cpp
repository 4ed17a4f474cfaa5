#include "TaskRepository.hpp"

#include <QDateTime>
#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include <QtSql/QSqlRecord>

#include "Connection.hpp"
#include "GroupRepository.hpp"
#include "Logger.hpp"
#include "StoreError.hpp"
#include "TextUtils.hpp"

namespace {

const char *const kSelectColumns =
    "SELECT id, group_id, title, content, status, important, urgent, "
    "created_at, updated_at FROM tasks";

Task rowToTask(const QSqlRecord &record) {
    Task task;
    task.id = record.value("id").toLongLong();
    task.groupId = record.value("group_id").toLongLong();
    task.title = record.value("title").toString();
    task.content = record.value("content").toString();
    task.status = record.value("status").toString();
    task.important = record.value("important").toInt() == 1;
    task.urgent = record.value("urgent").toInt() == 1;
    task.createdAt = record.value("created_at").toLongLong();
    task.updatedAt = record.value("updated_at").toLongLong();

    // The CHECK constraint keeps this from happening in files we wrote.
    if (!parseStatus(task.status)) {
        throw StoreError::infrastructure(
            QStringLiteral("parse task status"),
            QStringLiteral("unexpected value \"%1\" for task %2").arg(task.status).arg(task.id));
    }
    return task;
}

QString notFoundMessage(qint64 id) {
    return QStringLiteral("task not found (id=%1)").arg(id);
}

} // END NAMESPACE

TaskRepository::TaskRepository(Connection &connection, const GroupRepository &groups)
    : m_connection(connection), m_groups(groups) {}

std::vector<Task> TaskRepository::list() const {
    std::vector<Task> out;

    QSqlQuery query(m_connection.database());
    if (!query.exec(QString::fromLatin1(kSelectColumns) +
                    QStringLiteral(" ORDER BY updated_at DESC, id DESC"))) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "list tasks:" << detail;
        throw StoreError::infrastructure(QStringLiteral("list tasks"), detail);
    }

    while (query.next()) {
        out.push_back(rowToTask(query.record()));
    }

    qDebug(appSql) << "→" << out.size() << "tasks fetched";
    return out;
}

std::optional<Task> TaskRepository::get(qint64 id) const {
    QSqlQuery query(m_connection.database());
    query.prepare(QString::fromLatin1(kSelectColumns) + QStringLiteral(" WHERE id = ?"));
    query.addBindValue(id);

    if (!query.exec()) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "get task:" << detail;
        throw StoreError::infrastructure(QStringLiteral("get task"), detail);
    }
    if (!query.next()) {
        return std::nullopt;
    }
    return rowToTask(query.record());
}

// Order matters: callers see the first problem in this sequence.
Task TaskRepository::validated(const Task &input) const {
    const auto reject = [](const QString &message) {
        qWarning(appSql) << "Task rejected:" << message;
        return StoreError::validation(message);
    };

    Task task = input;
    task.title = task.title.trimmed();
    task.content = task.content.trimmed();

    if (task.id < 0) {
        throw reject(QStringLiteral("invalid task id"));
    }
    if (task.groupId <= 0) {
        throw reject(QStringLiteral("please select a group"));
    }
    if (!m_groups.exists(task.groupId)) {
        throw reject(
            QStringLiteral("group not found (id=%1)").arg(task.groupId));
    }
    if (task.title.isEmpty()) {
        throw reject(QStringLiteral("task title must not be empty"));
    }
    if (codePointCount(task.title) > kMaxTitleLength) {
        throw reject(
            QStringLiteral("task title is too long (max %1 characters)").arg(kMaxTitleLength));
    }
    if (codePointCount(task.content) > kMaxContentLength) {
        throw reject(
            QStringLiteral("task content is too long (max %1 characters)").arg(kMaxContentLength));
    }
    if (!parseStatus(task.status)) {
        throw reject(QStringLiteral("invalid task status: \"%1\"").arg(task.status));
    }
    return task;
}

Task TaskRepository::upsert(const Task &input) {
    Task task = validated(input);

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    QSqlQuery query(m_connection.database());

    if (task.id == 0) {
        query.prepare(QStringLiteral(
            "INSERT INTO tasks(group_id, title, content, status, important, urgent, "
            "created_at, updated_at) VALUES(?, ?, ?, ?, ?, ?, ?, ?)"));
        query.addBindValue(task.groupId);
        query.addBindValue(task.title);
        query.addBindValue(task.content);
        query.addBindValue(task.status);
        query.addBindValue(task.important ? 1 : 0);
        query.addBindValue(task.urgent ? 1 : 0);
        query.addBindValue(now);
        query.addBindValue(now);

        if (!query.exec()) {
            const QString detail = query.lastError().text();
            qCritical(appSql) << "create task:" << detail;
            throw StoreError::infrastructure(QStringLiteral("create task"), detail);
        }

        task.id = query.lastInsertId().toLongLong();
        task.createdAt = now;
        task.updatedAt = now;
        qInfo(appSql) << "Task inserted id=" << task.id << "title=" << task.title;
        return task;
    }

    query.prepare(QStringLiteral(
        "UPDATE tasks SET group_id = ?, title = ?, content = ?, status = ?, "
        "important = ?, urgent = ?, updated_at = ? WHERE id = ?"));
    query.addBindValue(task.groupId);
    query.addBindValue(task.title);
    query.addBindValue(task.content);
    query.addBindValue(task.status);
    query.addBindValue(task.important ? 1 : 0);
    query.addBindValue(task.urgent ? 1 : 0);
    query.addBindValue(now);
    query.addBindValue(task.id);

    if (!query.exec()) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "update task:" << detail;
        throw StoreError::infrastructure(QStringLiteral("update task"), detail);
    }
    if (query.numRowsAffected() == 0) {
        qInfo(appSql) << "No rows updated for task id=" << task.id;
        throw StoreError::notFound(notFoundMessage(task.id));
    }

    const auto reloaded = get(task.id);
    if (!reloaded) {
        throw StoreError::infrastructure(QStringLiteral("reload task"),
                                         notFoundMessage(task.id));
    }
    qInfo(appSql) << "Task updated id=" << task.id;
    return *reloaded;
}

void TaskRepository::remove(qint64 id) {
    if (id <= 0) {
        qWarning(appSql) << "Rejected task delete with id=" << id;
        throw StoreError::validation(QStringLiteral("invalid task id"));
    }

    QSqlQuery query(m_connection.database());
    query.prepare(QStringLiteral("DELETE FROM tasks WHERE id = ?"));
    query.addBindValue(id);

    if (!query.exec()) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "delete task:" << detail;
        throw StoreError::infrastructure(QStringLiteral("delete task"), detail);
    }
    if (query.numRowsAffected() == 0) {
        qInfo(appSql) << "Not found task id=" << id;
        throw StoreError::notFound(notFoundMessage(id));
    }

    qInfo(appSql) << "Task deleted id=" << id;
}
