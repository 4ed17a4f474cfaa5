#ifndef QUADRA_STORAGE_TASKREPOSITORY_HPP
#define QUADRA_STORAGE_TASKREPOSITORY_HPP

#include <optional>
#include <vector>

#include "Task.hpp"

class Connection;
class GroupRepository;

class TaskRepository {
public:
    TaskRepository(Connection &connection, const GroupRepository &groups);

    // Most recently updated first, ties broken by id descending.
    std::vector<Task> list() const;
    std::optional<Task> get(qint64 id) const;

    // id == 0 inserts, id > 0 rewrites every mutable field.
    // Status has no transition graph: any value may follow any other.
    // Throws StoreError.
    Task upsert(const Task &task);

    void remove(qint64 id);

    static constexpr int kMaxTitleLength = 200;
    static constexpr int kMaxContentLength = 1000;

private:
    Task validated(const Task &task) const;

    Connection &m_connection;
    const GroupRepository &m_groups;
};

#endif // QUADRA_STORAGE_TASKREPOSITORY_HPP
