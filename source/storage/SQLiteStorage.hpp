#ifndef QUADRA_STORAGE_SQLITESTORAGE_HPP
#define QUADRA_STORAGE_SQLITESTORAGE_HPP

#include <memory>

#include "IStorage.hpp"

class Connection;
class GroupRepository;
class TaskRepository;
class SettingsRepository;

class SQLiteStorage : public IStorage {
public:
    // Opens, migrates and seeds defaults, in that order. Throws
    // StoreError(Infrastructure) and keeps no connection on failure.
    explicit SQLiteStorage(const QString &dbPath);
    ~SQLiteStorage() override;

    std::vector<Group> listGroups() const override;
    Group upsertGroup(qint64 id, const QString &name) override;
    void deleteGroup(qint64 id) override;

    std::vector<Task> listTasks() const override;
    std::optional<Task> getTask(qint64 id) const override;
    Task upsertTask(const Task &task) override;
    void deleteTask(qint64 id) override;

    Settings getSettings() const override;
    void setSettings(const Settings &settings) override;

    qint64 lastReminderAt() const override;
    void setLastReminderAt(qint64 unixMs) override;

    // Idempotent.
    void close() override;
    bool isOpen() const;

private:
    void ensureOpen() const;

    std::unique_ptr<Connection> m_connection;
    std::unique_ptr<GroupRepository> m_groups;
    std::unique_ptr<TaskRepository> m_tasks;
    std::unique_ptr<SettingsRepository> m_settings;
};

// <user config dir>/<appName>/todo.db, creating the folder when missing.
QString defaultDatabasePath(const QString &appName);

#endif // QUADRA_STORAGE_SQLITESTORAGE_HPP
