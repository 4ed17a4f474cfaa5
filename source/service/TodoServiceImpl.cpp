#include "Logger.hpp"
#include "SQLiteStorage.hpp"
#include "TodoServiceImpl.hpp"

TodoServiceImpl::TodoServiceImpl()
    : TodoServiceImpl(StorageFactory([](const QString &dbPath) {
          return std::shared_ptr<IStorage>(std::make_shared<SQLiteStorage>(dbPath));
      })) {}

TodoServiceImpl::TodoServiceImpl(StorageFactory factory) : m_factory(std::move(factory)) {}

// ───────────────────────────────────────────────
// Lifecycle
// ───────────────────────────────────────────────

bool TodoServiceImpl::start(const QString &dbPath) {
    if (m_storage) {
        return true;
    }
    if (!m_factory) {
        m_startupError = StoreError::infrastructure(QStringLiteral("start"),
                                                    QStringLiteral("no storage factory"));
        return false;
    }

    try {
        m_storage = m_factory(dbPath);
        m_startupError.reset();
        qInfo(appCore) << "[Service] Store ready:" << dbPath;
        return true;
    } catch (const StoreError &e) {
        qCritical(appCore) << "[Service] Failed to open store:" << e.message();
        m_startupError = StoreError::infrastructure(
            QStringLiteral("initialization failed: cannot open database"), e.message());
        return false;
    }
}

void TodoServiceImpl::shutdown() {
    if (m_storage) {
        m_storage->close();
        m_storage.reset();
        qInfo(appCore) << "[Service] Store closed";
    }
}

IStorage &TodoServiceImpl::storage() const {
    if (m_storage) {
        return *m_storage;
    }
    if (m_startupError) {
        throw *m_startupError;
    }
    throw StoreError::infrastructure(QStringLiteral("application is not initialized yet"));
}

// ───────────────────────────────────────────────
// Board / groups / tasks
// ───────────────────────────────────────────────

Board TodoServiceImpl::board() const {
    IStorage &store = storage();

    Board result;
    result.groups = store.listGroups();
    result.tasks = store.listTasks();
    result.settings = store.getSettings();
    result.statuses = allStatuses();

    qInfo(appCore) << "[Service] Board:" << result.groups.size() << "groups,"
                   << result.tasks.size() << "tasks";
    return result;
}

Group TodoServiceImpl::upsertGroup(qint64 id, const QString &name) {
    return storage().upsertGroup(id, name);
}

void TodoServiceImpl::deleteGroup(qint64 id) {
    storage().deleteGroup(id);
}

std::optional<Task> TodoServiceImpl::task(qint64 taskId) const {
    return storage().getTask(taskId);
}

Task TodoServiceImpl::upsertTask(const Task &task) {
    return storage().upsertTask(task);
}

// Unchecking always lands on "todo", even if the task was "doing"
// before it was marked done.
Task TodoServiceImpl::toggleDone(qint64 taskId) {
    if (taskId <= 0) {
        throw StoreError::validation(QStringLiteral("invalid task id"));
    }

    IStorage &store = storage();
    auto task = store.getTask(taskId);
    if (!task) {
        throw StoreError::notFound(QStringLiteral("task not found (id=%1)").arg(taskId));
    }

    const bool wasDone = task->status == toString(Status::Done);
    task->status = toString(wasDone ? Status::Todo : Status::Done);

    qInfo(appCore) << "[Service] Toggle task" << taskId << "->" << task->status;
    return store.upsertTask(*task);
}

void TodoServiceImpl::deleteTask(qint64 taskId) {
    storage().deleteTask(taskId);
}

// ───────────────────────────────────────────────
// Settings
// ───────────────────────────────────────────────

Settings TodoServiceImpl::settings() const {
    return storage().getSettings();
}

Settings TodoServiceImpl::updateSettings(const std::function<void(Settings &)> &change) {
    IStorage &store = storage();
    Settings current = store.getSettings();
    change(current);
    store.setSettings(current);
    // Re-read so callers see normalized values (e.g. viewMode).
    return store.getSettings();
}

Settings TodoServiceImpl::setHideDone(bool hide) {
    return updateSettings([hide](Settings &s) { s.hideDone = hide; });
}

Settings TodoServiceImpl::setAlwaysOnTop(bool on) {
    return updateSettings([on](Settings &s) { s.alwaysOnTop = on; });
}

Settings TodoServiceImpl::setViewMode(const QString &mode) {
    return updateSettings([&mode](Settings &s) { s.viewMode = mode; });
}

Settings TodoServiceImpl::setConciseMode(bool on) {
    return updateSettings([on](Settings &s) { s.conciseMode = on; });
}

Settings TodoServiceImpl::setTheme(const QString &theme) {
    return updateSettings([&theme](Settings &s) { s.theme = theme; });
}

// ───────────────────────────────────────────────
// Reminder throttle
// ───────────────────────────────────────────────

bool TodoServiceImpl::shouldShowReminder(qint64 nowMs) const {
    qint64 lastAt = 0;
    try {
        lastAt = storage().lastReminderAt();
    } catch (const StoreError &e) {
        if (e.kind() != StoreError::Kind::Infrastructure || !m_storage) {
            throw;
        }
        // A broken timestamp must not suppress the reminder forever.
        qWarning(appCore) << "[Service] Cannot read last reminder time:" << e.message();
        return true;
    }
    return lastAt <= 0 || nowMs - lastAt >= kReminderIntervalMs;
}

void TodoServiceImpl::markReminderShown(qint64 nowMs) {
    storage().setLastReminderAt(nowMs);
}
