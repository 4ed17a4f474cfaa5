#ifndef QUADRA_UTILS_ERRORHANDLER_HPP
#define QUADRA_UTILS_ERRORHANDLER_HPP

#include <QDateTime>
#include <QJsonObject>
#include <exception>
#include <functional>

#include "Logger.hpp"
#include "StoreError.hpp"

inline QString errorType(StoreError::Kind kind) {
    switch (kind) {
    case StoreError::Kind::Validation: return QStringLiteral("validation_error");
    case StoreError::Kind::Conflict: return QStringLiteral("conflict");
    case StoreError::Kind::NotFound: return QStringLiteral("not_found");
    case StoreError::Kind::Infrastructure: return QStringLiteral("not_ready");
    }
    return QStringLiteral("error");
}

inline QJsonObject makeApiError(const QString &type, const QString &message,
                                QJsonObject details = {}) {
    QJsonObject obj{{"ok", false},
                    {"type", type},
                    {"message", message},
                    {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs)}};
    if (!details.isEmpty())
        obj.insert("details", details);
    return obj;
}

inline QJsonObject makeApiOk(const QString &message = QString(), QJsonObject data = {}) {
    QJsonObject obj{{"ok", true},
                    {"message", message},
                    {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs)}};
    if (!data.isEmpty())
        obj.insert("data", data);
    return obj;
}

// Caller mistakes keep their message; infrastructure detail only goes
// to the log and the user sees a generic "not ready".
inline QJsonObject makeApiError(const StoreError &error) {
    if (error.kind() == StoreError::Kind::Infrastructure) {
        return makeApiError(errorType(error.kind()),
                            QStringLiteral("store is not ready, see log for details"));
    }
    return makeApiError(errorType(error.kind()), error.message());
}

inline QJsonObject wrapSafe(const char *commandName, const std::function<QJsonObject()> &fn) {
    const qint64 started = QDateTime::currentMSecsSinceEpoch();
    try {
        QJsonObject resp = fn();
        qInfo(appCore) << "[DONE]" << commandName
                       << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started);
        return resp;
    } catch (const StoreError &e) {
        if (e.kind() == StoreError::Kind::Infrastructure) {
            qCritical(appCore) << "[FAIL]" << commandName << "| what=" << e.message();
        } else {
            qWarning(appCore) << "[REJECT]" << commandName << "|" << e.message();
        }
        return makeApiError(e);
    } catch (const std::exception &e) {
        qCritical(appCore) << "[EXC]" << commandName
                           << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started)
                           << "| what=" << e.what();
        return makeApiError(QStringLiteral("internal_error"), QStringLiteral("Internal error"),
                            QJsonObject{{"what", QString::fromUtf8(e.what())}});
    }
}

#endif // QUADRA_UTILS_ERRORHANDLER_HPP
