#ifndef QUADRA_STORAGE_SETTINGSREPOSITORY_HPP
#define QUADRA_STORAGE_SETTINGSREPOSITORY_HPP

#include <QString>

#include "Settings.hpp"

class Connection;

class SettingsRepository {
public:
    explicit SettingsRepository(Connection &connection);

    // Defaults overlaid with whatever keys are stored; unknown keys are ignored.
    Settings get() const;

    // Writes each user-facing key on its own; the first failing key throws.
    void set(const Settings &settings);

    // Unix ms of the last periodic reminder, 0 when never shown.
    qint64 lastReminderAt() const;
    void setLastReminderAt(qint64 unixMs);

    static QString normalizeViewMode(const QString &value);

    static constexpr int kMaxViewModeLength = 20;

private:
    void setValue(const QString &key, const QString &value);

    Connection &m_connection;
};

#endif // QUADRA_STORAGE_SETTINGSREPOSITORY_HPP
