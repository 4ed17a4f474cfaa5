#ifndef QUADRA_SERVICE_TODOSERVICEIMPL_HPP
#define QUADRA_SERVICE_TODOSERVICEIMPL_HPP

#include <functional>
#include <memory>
#include <optional>

#include "IStorage.hpp"
#include "ITodoService.hpp"
#include "StoreError.hpp"

class TodoServiceImpl : public ITodoService {
public:
    using StorageFactory = std::function<std::shared_ptr<IStorage>(const QString &dbPath)>;

    // Not ready until start() succeeds.
    TodoServiceImpl();
    explicit TodoServiceImpl(StorageFactory factory);

    // Opens the store. A failure is kept and returned by every later call.
    bool start(const QString &dbPath);
    void shutdown();
    bool isReady() const { return static_cast<bool>(m_storage); }
    const std::optional<StoreError> &startupError() const { return m_startupError; }

    Board board() const override;

    Group upsertGroup(qint64 id, const QString &name) override;
    void deleteGroup(qint64 id) override;

    std::optional<Task> task(qint64 taskId) const override;
    Task upsertTask(const Task &task) override;
    Task toggleDone(qint64 taskId) override;
    void deleteTask(qint64 taskId) override;

    Settings settings() const override;
    Settings setHideDone(bool hide) override;
    Settings setAlwaysOnTop(bool on) override;
    Settings setViewMode(const QString &mode) override;
    Settings setConciseMode(bool on) override;
    Settings setTheme(const QString &theme) override;

    bool shouldShowReminder(qint64 nowMs) const override;
    void markReminderShown(qint64 nowMs) override;

    static constexpr qint64 kReminderIntervalMs = 60 * 60 * 1000;

private:
    IStorage &storage() const;
    Settings updateSettings(const std::function<void(Settings &)> &change);

    StorageFactory m_factory;
    std::shared_ptr<IStorage> m_storage;
    std::optional<StoreError> m_startupError;
};

#endif // QUADRA_SERVICE_TODOSERVICEIMPL_HPP
