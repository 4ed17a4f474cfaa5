#include "SQLiteStorage.hpp"

#include <QDir>
#include <QStandardPaths>

#include "Connection.hpp"
#include "DefaultsBootstrapper.hpp"
#include "GroupRepository.hpp"
#include "Logger.hpp"
#include "SchemaMigrator.hpp"
#include "SettingsRepository.hpp"
#include "StoreError.hpp"
#include "TaskRepository.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// lifecycle
// ─────────────────────────────────────────────────────────────────────────────
SQLiteStorage::SQLiteStorage(const QString &dbPath)
    : m_connection(std::make_unique<Connection>(dbPath)) {
    // m_connection is released by its unique_ptr if either step throws.
    SchemaMigrator(*m_connection).migrate();
    DefaultsBootstrapper(*m_connection).ensureDefaults();

    m_groups = std::make_unique<GroupRepository>(*m_connection);
    m_tasks = std::make_unique<TaskRepository>(*m_connection, *m_groups);
    m_settings = std::make_unique<SettingsRepository>(*m_connection);

    qInfo(appSql) << "SQLiteStorage ready, path:" << m_connection->path();
}

SQLiteStorage::~SQLiteStorage() {
    close();
}

void SQLiteStorage::close() {
    if (!m_connection) {
        return;
    }
    m_settings.reset();
    m_tasks.reset();
    m_groups.reset();
    m_connection->close();
    m_connection.reset();
}

bool SQLiteStorage::isOpen() const {
    return m_connection && m_connection->isOpen();
}

void SQLiteStorage::ensureOpen() const {
    if (!isOpen()) {
        throw StoreError::infrastructure(QStringLiteral("store is closed"));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// groups
// ─────────────────────────────────────────────────────────────────────────────
std::vector<Group> SQLiteStorage::listGroups() const {
    ensureOpen();
    return m_groups->list();
}

Group SQLiteStorage::upsertGroup(qint64 id, const QString &name) {
    ensureOpen();
    return m_groups->upsert(id, name);
}

void SQLiteStorage::deleteGroup(qint64 id) {
    ensureOpen();
    m_groups->remove(id);
}

// ─────────────────────────────────────────────────────────────────────────────
// tasks
// ─────────────────────────────────────────────────────────────────────────────
std::vector<Task> SQLiteStorage::listTasks() const {
    ensureOpen();
    return m_tasks->list();
}

std::optional<Task> SQLiteStorage::getTask(qint64 id) const {
    ensureOpen();
    return m_tasks->get(id);
}

Task SQLiteStorage::upsertTask(const Task &task) {
    ensureOpen();
    return m_tasks->upsert(task);
}

void SQLiteStorage::deleteTask(qint64 id) {
    ensureOpen();
    m_tasks->remove(id);
}

// ─────────────────────────────────────────────────────────────────────────────
// settings
// ─────────────────────────────────────────────────────────────────────────────
Settings SQLiteStorage::getSettings() const {
    ensureOpen();
    return m_settings->get();
}

void SQLiteStorage::setSettings(const Settings &settings) {
    ensureOpen();
    m_settings->set(settings);
}

qint64 SQLiteStorage::lastReminderAt() const {
    ensureOpen();
    return m_settings->lastReminderAt();
}

void SQLiteStorage::setLastReminderAt(qint64 unixMs) {
    ensureOpen();
    m_settings->setLastReminderAt(unixMs);
}

// Per-user config dir rather than next to the binary, which is often
// read-only once installed.
QString defaultDatabasePath(const QString &appName) {
    const QString configRoot =
        QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (configRoot.isEmpty()) {
        throw StoreError::infrastructure(QStringLiteral("get user config dir"),
                                         QStringLiteral("no writable config location"));
    }

    QDir appDir(QDir(configRoot).filePath(appName));
    if (!appDir.mkpath(QStringLiteral("."))) {
        throw StoreError::infrastructure(QStringLiteral("create app data dir"),
                                         appDir.absolutePath());
    }

    return appDir.filePath(QStringLiteral("todo.db"));
}
