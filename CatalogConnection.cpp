// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <atomic>
#include <QDebug>
#include <QSqlError>
#include <QSqlQuery>
#include "CatalogConnection.h"

static QString nextConnectionName() {
    static std::atomic<quint64> counter{0};
    return QStringLiteral("tagdeck-catalog-%1").arg(++counter);
}

CatalogConnection::CatalogConnection(const QString& databasePath, int busyTimeoutMs)
    : m_name(nextConnectionName()) {
    m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_name);
    m_db.setDatabaseName(databasePath);
    m_db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=%1").arg(busyTimeoutMs));

    if (!m_db.open()) {
        m_error = m_db.lastError().text();
        qWarning().noquote() << "Failed to open catalog" << databasePath << ":" << m_error;
        return;
    }

    m_open = exec(QStringLiteral("PRAGMA foreign_keys = ON;"), &m_error)
          && exec(QStringLiteral("PRAGMA case_sensitive_like = ON;"), &m_error);
}

CatalogConnection::~CatalogConnection() {
    if (m_db.isOpen()) {
        m_db.close();
    }

    // removeDatabase() warns (and leaks) if a handle is still alive, so drop ours first
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_name);
}

bool CatalogConnection::exec(const QString& sql, QString* errorOut) {
    QSqlQuery q(m_db);
    if (!q.exec(sql)) {
        const QString err = q.lastError().text();
        qWarning().noquote() << "SQL failed:" << sql << "-" << err;
        if (errorOut) *errorOut = err;
        return false;
    }
    return true;
}

CatalogTransaction::CatalogTransaction(CatalogConnection& conn)
    : m_conn(conn) {
    // IMMEDIATE takes the write lock up front, so a writer on another connection makes us wait
    // in the busy handler instead of failing on a read-to-write lock upgrade.
    m_active = m_conn.exec(QStringLiteral("BEGIN IMMEDIATE;"), &m_error);
}

CatalogTransaction::~CatalogTransaction() {
    if (m_active) {
        QString err;
        if (!m_conn.exec(QStringLiteral("ROLLBACK;"), &err)) {
            qWarning().noquote() << "Rollback failed:" << err;
        }
    }
}

bool CatalogTransaction::commit(QString* errorOut) {
    if (!m_active) {
        if (errorOut) *errorOut = m_error.isEmpty() ? QStringLiteral("No active transaction") : m_error;
        return false;
    }
    if (!m_conn.exec(QStringLiteral("COMMIT;"), errorOut)) {
        return false;
    }
    m_active = false;
    return true;
}
