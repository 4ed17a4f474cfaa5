#ifndef QUADRA_STORAGE_ISTORAGE_HPP
#define QUADRA_STORAGE_ISTORAGE_HPP

#include <optional>
#include <vector>

#include "Group.hpp"
#include "Settings.hpp"
#include "Task.hpp"

// Everything outside the storage layer talks to the database through
// this surface; implementations throw StoreError on failure.
class IStorage {
public:
    virtual ~IStorage() = default;

    virtual std::vector<Group> listGroups() const = 0;
    virtual Group upsertGroup(qint64 id, const QString &name) = 0;
    virtual void deleteGroup(qint64 id) = 0;

    virtual std::vector<Task> listTasks() const = 0;
    virtual std::optional<Task> getTask(qint64 id) const = 0;
    virtual Task upsertTask(const Task &task) = 0;
    virtual void deleteTask(qint64 id) = 0;

    virtual Settings getSettings() const = 0;
    virtual void setSettings(const Settings &settings) = 0;

    virtual qint64 lastReminderAt() const = 0;
    virtual void setLastReminderAt(qint64 unixMs) = 0;

    virtual void close() = 0;
};

#endif // QUADRA_STORAGE_ISTORAGE_HPP
