#ifndef DATABASEMANAGER_H
#define DATABASEMANAGER_H

#include <QDateTime>
#include <QSqlDatabase>
#include <QString>

class BomError;
class QSqlQuery;

// Simple singleton wrapper around QSqlDatabase to centralize connection logic
class DatabaseManager {
public:
    static DatabaseManager &instance();

    /// open a SQLite file (or ":memory:") and create the schema
    bool open(const QString &fileName);

    /// close and drop the connection so a later open() starts fresh
    void close();

    bool isOpen() const;
    QSqlDatabase database() const;

    /// create required tables if they do not exist
    bool createSchema();

    // log a failed query and turn it into a StorageError; returns false
    static bool reportQueryError(const QSqlQuery &query, const QString &what, BomError *error);

    // timestamps are stored as UTC ISO-8601 text
    static QString toStorage(const QDateTime &at);
    static QDateTime fromStorage(const QVariant &value);

private:
    DatabaseManager();
    ~DatabaseManager();

    QSqlDatabase m_db;
};

// Scoped transaction: rolls back on destruction unless commit() succeeded
class SqlTransaction {
public:
    explicit SqlTransaction(QSqlDatabase db);
    ~SqlTransaction();

    bool isActive() const { return m_active; }
    bool commit();
    void rollback();

private:
    SqlTransaction(const SqlTransaction &) = delete;
    SqlTransaction &operator=(const SqlTransaction &) = delete;

    QSqlDatabase m_db;
    bool m_active;
};

#endif // DATABASEMANAGER_H
