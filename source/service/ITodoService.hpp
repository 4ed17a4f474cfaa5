#ifndef QUADRA_SERVICE_ITODOSERVICE_HPP
#define QUADRA_SERVICE_ITODOSERVICE_HPP

#include <optional>
#include <vector>

#include "Board.hpp"
#include "Group.hpp"
#include "Settings.hpp"
#include "Task.hpp"

class ITodoService {
public:
    virtual ~ITodoService() = default;

    virtual Board board() const = 0;

    virtual Group upsertGroup(qint64 id, const QString &name) = 0;
    virtual void deleteGroup(qint64 id) = 0;

    virtual std::optional<Task> task(qint64 taskId) const = 0;
    virtual Task upsertTask(const Task &task) = 0;
    virtual Task toggleDone(qint64 taskId) = 0;
    virtual void deleteTask(qint64 taskId) = 0;

    virtual Settings settings() const = 0;
    virtual Settings setHideDone(bool hide) = 0;
    virtual Settings setAlwaysOnTop(bool on) = 0;
    virtual Settings setViewMode(const QString &mode) = 0;
    virtual Settings setConciseMode(bool on) = 0;
    virtual Settings setTheme(const QString &theme) = 0;

    virtual bool shouldShowReminder(qint64 nowMs) const = 0;
    virtual void markReminderShown(qint64 nowMs) = 0;
};

#endif // QUADRA_SERVICE_ITODOSERVICE_HPP
