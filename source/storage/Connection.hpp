#ifndef QUADRA_STORAGE_CONNECTION_HPP
#define QUADRA_STORAGE_CONNECTION_HPP

#include <QString>
#include <QtSql/QSqlDatabase>
#include <QtSql/QSqlError>

// The single SQLite connection a store owns for its whole lifetime.
// One live Connection per database file per process; a second open of
// the same file fails instead of creating a competing writer.
class Connection {
public:
    // Opens `dbPath` and applies the session pragmas. Throws StoreError.
    explicit Connection(const QString &dbPath);
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    bool isOpen() const;
    void close();

    const QString &path() const { return m_path; }

    // Runs a statement that returns no rows of interest. Throws on failure.
    void exec(const QString &sql, const QString &operation);

    // Only the storage layer uses this; it never leaves SQLiteStorage.
    QSqlDatabase database() const { return m_db; }

    static constexpr int kBusyTimeoutMs = 5000;

private:
    void applyPragmas();

    QString m_path;
    QString m_connectionName;
    QSqlDatabase m_db;
};

// True when the engine rejected a write because of a UNIQUE constraint.
// Other constraint failures (NOT NULL, CHECK, FOREIGN KEY) return false.
bool isUniqueViolation(const QSqlError &error);

#endif // QUADRA_STORAGE_CONNECTION_HPP
