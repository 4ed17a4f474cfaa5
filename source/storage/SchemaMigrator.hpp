#ifndef QUADRA_STORAGE_SCHEMAMIGRATOR_HPP
#define QUADRA_STORAGE_SCHEMAMIGRATOR_HPP

#include <QSet>
#include <QString>
#include <vector>

class Connection;

// One idempotent schema step. When `column` is empty the statement is
// expected to be self-guarding (IF NOT EXISTS); otherwise it only runs
// while `table` lacks `column`.
struct MigrationStep {
    QString description;
    QString sql;
    QString table;
    QString column;
};

class SchemaMigrator {
public:
    explicit SchemaMigrator(Connection &connection);

    // Brings the schema to the current shape. Safe to run on every start.
    // Throws StoreError(Infrastructure) on the first failing step.
    void migrate();

    QSet<QString> columnsOf(const QString &table) const;

    // New steps are appended at the end; existing ones never change.
    static const std::vector<MigrationStep> &steps();

private:
    Connection &m_connection;
};

#endif // QUADRA_STORAGE_SCHEMAMIGRATOR_HPP
