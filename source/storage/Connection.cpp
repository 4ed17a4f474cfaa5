#include "Connection.hpp"

#include <QFileInfo>
#include <QVariant>
#include <QtSql/QSqlQuery>

#include "Logger.hpp"
#include "StoreError.hpp"

namespace {

constexpr int kSqliteConstraint = 19;
constexpr int kSqliteConstraintUnique = 2067;    // SQLITE_CONSTRAINT | (8 << 8)

QString connectionNameFor(const QString &absolutePath) {
    return QStringLiteral("quadra:") + absolutePath;
}

} // END NAMESPACE

Connection::Connection(const QString &dbPath) {
    if (dbPath.trimmed().isEmpty()) {
        throw StoreError::infrastructure(QStringLiteral("open database"),
                                         QStringLiteral("database path is empty"));
    }

    m_path = QFileInfo(dbPath).absoluteFilePath();
    const QString name = connectionNameFor(m_path);

    if (QSqlDatabase::contains(name)) {
        qCritical(appSql) << "Refusing second connection to" << m_path;
        throw StoreError::infrastructure(QStringLiteral("open database"),
                                         QStringLiteral("database is already open"));
    }

    m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
    m_connectionName = name;
    m_db.setDatabaseName(m_path);
    m_db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=%1").arg(kBusyTimeoutMs));

    if (!m_db.isValid()) {
        qCritical(appSql) << "QSQLITE driver not available";
        close();
        throw StoreError::infrastructure(QStringLiteral("open database"),
                                         QStringLiteral("sqlite driver not available"));
    }

    if (!m_db.open()) {
        const QString detail = m_db.lastError().text();
        qCritical(appSql) << "Failed to open database:" << detail;
        close();
        throw StoreError::infrastructure(QStringLiteral("open database"), detail);
    }

    try {
        applyPragmas();
    } catch (const StoreError &) {
        close();
        throw;
    }

    qInfo(appSql) << "Connection ready, path:" << m_path;
}

Connection::~Connection() {
    close();
}

bool Connection::isOpen() const {
    return !m_connectionName.isEmpty() && m_db.isOpen();
}

void Connection::close() {
    if (m_connectionName.isEmpty()) {
        return;
    }

    if (m_db.isOpen()) {
        m_db.close();
    }
    // removeDatabase warns while a handle is still referenced.
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
    qInfo(appSql) << "Connection closed, path:" << m_path;
    m_connectionName.clear();
}

void Connection::exec(const QString &sql, const QString &operation) {
    QSqlQuery query(m_db);
    if (!query.exec(sql)) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << operation << "failed:" << detail;
        throw StoreError::infrastructure(operation, detail);
    }
}

// foreign_keys: enforce group ownership and ON DELETE CASCADE
// busy_timeout: wait out transient lock contention instead of failing
// journal_mode=WAL: readers do not block the frequent small writes
void Connection::applyPragmas() {
    exec(QStringLiteral("PRAGMA foreign_keys = ON"), QStringLiteral("pragma foreign_keys"));
    exec(QStringLiteral("PRAGMA busy_timeout = %1").arg(kBusyTimeoutMs),
         QStringLiteral("pragma busy_timeout"));

    QSqlQuery query(m_db);
    if (!query.exec(QStringLiteral("PRAGMA journal_mode = WAL"))) {
        const QString detail = query.lastError().text();
        qCritical(appSql) << "pragma journal_mode failed:" << detail;
        throw StoreError::infrastructure(QStringLiteral("pragma journal_mode"), detail);
    }
    if (query.next()) {
        qDebug(appSql) << "journal_mode =" << query.value(0).toString();
    }
}

bool isUniqueViolation(const QSqlError &error) {
    bool ok = false;
    const int code = error.nativeErrorCode().toInt(&ok);
    if (!ok || (code & 0xff) != kSqliteConstraint) {
        return false;
    }
    if (code == kSqliteConstraintUnique) {
        return true;
    }
    // Without extended result codes only the primary code is reported.
    return error.databaseText().contains(QLatin1String("UNIQUE constraint failed"));
}
