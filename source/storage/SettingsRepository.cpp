#include "SettingsRepository.hpp"

#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>

#include "Connection.hpp"
#include "Logger.hpp"
#include "StoreError.hpp"
#include "TextUtils.hpp"

namespace {

const QString kHideDone = QStringLiteral("hideDone");
const QString kAlwaysOnTop = QStringLiteral("alwaysOnTop");
const QString kViewMode = QStringLiteral("viewMode");
const QString kConciseMode = QStringLiteral("conciseMode");
const QString kTheme = QStringLiteral("theme");
const QString kLastReminderAt = QStringLiteral("lastWaterReminderAt");

} // END NAMESPACE

SettingsRepository::SettingsRepository(Connection &connection) : m_connection(connection) {}

QString SettingsRepository::normalizeViewMode(const QString &value) {
    const QString mode = value.trimmed().toLower();
    if (codePointCount(mode) > kMaxViewModeLength) {
        return QStringLiteral("cards");
    }
    if (mode == QLatin1String("list") || mode == QLatin1String("cards")) {
        return mode;
    }
    return QStringLiteral("cards");
}

Settings SettingsRepository::get() const {
    Settings settings;

    QSqlQuery query(m_connection.database());
    if (!query.exec(QStringLiteral("SELECT key, value FROM settings"))) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "list settings:" << detail;
        throw StoreError::infrastructure(QStringLiteral("list settings"), detail);
    }

    while (query.next()) {
        const QString key = query.value(0).toString();
        const QString value = query.value(1).toString();

        if (key == kAlwaysOnTop) {
            settings.alwaysOnTop = parseBoolText(value);
        } else if (key == kHideDone) {
            settings.hideDone = parseBoolText(value);
        } else if (key == kViewMode) {
            settings.viewMode = normalizeViewMode(value);
        } else if (key == kConciseMode) {
            settings.conciseMode = parseBoolText(value);
        } else if (key == kTheme) {
            settings.theme = value;
        }
    }

    return settings;
}

void SettingsRepository::set(const Settings &settings) {
    setValue(kAlwaysOnTop, boolTo01(settings.alwaysOnTop));
    setValue(kHideDone, boolTo01(settings.hideDone));
    setValue(kViewMode, normalizeViewMode(settings.viewMode));
    setValue(kConciseMode, boolTo01(settings.conciseMode));

    const QString theme = settings.theme.trimmed();
    if (!theme.isEmpty()) {
        setValue(kTheme, theme);
    }

    qInfo(appSql) << "Settings saved";
}

qint64 SettingsRepository::lastReminderAt() const {
    QSqlQuery query(m_connection.database());
    query.prepare(QStringLiteral("SELECT value FROM settings WHERE key = ?"));
    query.addBindValue(kLastReminderAt);

    if (!query.exec()) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "get" << kLastReminderAt << ":" << detail;
        throw StoreError::infrastructure(QStringLiteral("get %1").arg(kLastReminderAt), detail);
    }
    if (!query.next()) {
        return 0;
    }

    const QString value = query.value(0).toString().trimmed();
    if (value.isEmpty()) {
        return 0;
    }

    bool ok = false;
    const qint64 ts = value.toLongLong(&ok);
    if (!ok) {
        qCritical(appSql) << "Unparsable" << kLastReminderAt << "value:" << value;
        throw StoreError::infrastructure(QStringLiteral("parse %1").arg(kLastReminderAt),
                                         QStringLiteral("not an integer: \"%1\"").arg(value));
    }
    return ts > 0 ? ts : 0;
}

void SettingsRepository::setLastReminderAt(qint64 unixMs) {
    setValue(kLastReminderAt, QString::number(unixMs > 0 ? unixMs : 0));
}

void SettingsRepository::setValue(const QString &key, const QString &value) {
    QSqlQuery query(m_connection.database());
    query.prepare(QStringLiteral("INSERT INTO settings(key, value) VALUES(?, ?) "
                                 "ON CONFLICT(key) DO UPDATE SET value = excluded.value"));
    query.addBindValue(key);
    query.addBindValue(value);

    if (!query.exec()) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "set setting" << key << "failed:" << detail;
        throw StoreError::infrastructure(QStringLiteral("set setting \"%1\"").arg(key), detail);
    }
}
