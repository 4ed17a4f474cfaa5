#ifndef QUADRA_STORAGE_DEFAULTSBOOTSTRAPPER_HPP
#define QUADRA_STORAGE_DEFAULTSBOOTSTRAPPER_HPP

#include <QString>
#include <utility>
#include <vector>

class Connection;

class DefaultsBootstrapper {
public:
    explicit DefaultsBootstrapper(Connection &connection);

    // Seeds a default group when none exists and every missing setting
    // key. Values already stored are left untouched. Throws StoreError.
    void ensureDefaults();

    static QString defaultGroupName();
    static const std::vector<std::pair<QString, QString>> &defaultSettings();

private:
    void ensureDefaultSettings();
    void ensureDefaultGroup();

    Connection &m_connection;
};

#endif // QUADRA_STORAGE_DEFAULTSBOOTSTRAPPER_HPP
