#ifndef QUADRA_STORAGE_GROUPREPOSITORY_HPP
#define QUADRA_STORAGE_GROUPREPOSITORY_HPP

#include <optional>
#include <vector>

#include "Group.hpp"

class Connection;

class GroupRepository {
public:
    explicit GroupRepository(Connection &connection);

    // Ascending by id.
    std::vector<Group> list() const;
    std::optional<Group> get(qint64 id) const;
    bool exists(qint64 id) const;

    // id == 0 inserts, id > 0 renames. Throws StoreError.
    Group upsert(qint64 id, const QString &name);

    // Owned tasks go with the group through ON DELETE CASCADE.
    void remove(qint64 id);

    static constexpr int kMaxNameLength = 50;

private:
    Connection &m_connection;
};

#endif // QUADRA_STORAGE_GROUPREPOSITORY_HPP
