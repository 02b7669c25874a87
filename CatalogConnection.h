// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef TAGDECK_CATALOGCONNECTION_H
#define TAGDECK_CATALOGCONNECTION_H

#include <QSqlDatabase>
#include <QString>

/**
 * @brief One SQLite connection, scoped to a single logical catalog operation.
 *
 * Qt only allows a QSqlDatabase to be used from the thread that created it, and the
 * reconciler writes from a worker thread while the foreground keeps reading. Each
 * operation therefore opens its own uniquely named connection and the destructor
 * closes and unregisters it, on every exit path.
 *
 * Every connection enables foreign keys (cascade deletes) and case sensitive LIKE
 * (path matching follows Linux filesystem rules).
 *
 * Any QSqlQuery built on database() must be destroyed before this object.
 */
class CatalogConnection {
public:
    CatalogConnection(const QString& databasePath, int busyTimeoutMs);
    ~CatalogConnection();

    CatalogConnection(const CatalogConnection&) = delete;
    CatalogConnection& operator=(const CatalogConnection&) = delete;

    [[nodiscard]] bool isOpen() const { return m_open; }
    [[nodiscard]] const QString& lastError() const { return m_error; }

    QSqlDatabase& database() { return m_db; }

    /**
     * Executes a statement that returns no rows.
     * @return false on failure, with the driver message stored in errorOut (if given).
     */
    bool exec(const QString& sql, QString* errorOut = nullptr);

private:
    QString m_name;
    QSqlDatabase m_db;
    QString m_error;
    bool m_open = false;
};

/**
 * @brief Write transaction guard: BEGIN IMMEDIATE on construction, rolls back in the
 * destructor unless commit() succeeded.
 *
 * Check isActive() before writing; when BEGIN failed (lock held past the busy timeout),
 * lastError() carries the reason and statements would otherwise run in autocommit mode.
 */
class CatalogTransaction {
public:
    explicit CatalogTransaction(CatalogConnection& conn);
    ~CatalogTransaction();

    CatalogTransaction(const CatalogTransaction&) = delete;
    CatalogTransaction& operator=(const CatalogTransaction&) = delete;

    [[nodiscard]] bool isActive() const { return m_active; }
    [[nodiscard]] const QString& lastError() const { return m_error; }
    bool commit(QString* errorOut = nullptr);

private:
    CatalogConnection& m_conn;
    QString m_error;
    bool m_active = false;
};

#endif //TAGDECK_CATALOGCONNECTION_H
