// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <utility>
#include <QDateTime>
#include <QDebug>
#include <QFileInfo>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QVariantList>

#include "CatalogStore.h"
#include "CatalogConnection.h"
#include "Utils.h"

// SQLITE_CONSTRAINT; extended codes (e.g. SQLITE_CONSTRAINT_UNIQUE = 2067) keep it in the low byte
static constexpr int kSqliteConstraint = 19;

static void setError(QString* errorOut, const QString& message) {
    if (errorOut) *errorOut = message;
}

static bool beganOrFail(const CatalogTransaction& txn, QString* errorOut) {
    if (txn.isActive()) return true;
    setError(errorOut, txn.lastError());
    return false;
}

static bool openOrFail(const CatalogConnection& conn, QString* errorOut) {
    if (conn.isOpen()) return true;
    setError(errorOut, conn.lastError().isEmpty() ? QStringLiteral("Failed to open catalog database")
                                                  : conn.lastError());
    return false;
}

static bool execOrFail(QSqlQuery& q, QString* errorOut) {
    if (q.exec()) return true;

    const QString err = q.lastError().text();
    qWarning().noquote() << "SQL failed:" << q.lastQuery() << "-" << err;
    setError(errorOut, err);
    return false;
}

static bool isConstraintViolation(const QSqlError& err) {
    bool ok = false;
    const int code = err.nativeErrorCode().toInt(&ok);
    return ok && (code & 0xff) == kSqliteConstraint;
}

/**
 * SQL fragment matching `column` equal to a root or lying below it.
 * Binds two values, see bindUnderRoot().
 */
static QString underRootClause(const QString& column) {
    return QStringLiteral("(%1 = ? OR %1 LIKE ? ESCAPE '\\')").arg(column);
}

static void bindUnderRoot(QSqlQuery& q, const QString& normalizedRoot) {
    q.addBindValue(normalizedRoot);
    q.addBindValue(Utils::childrenLikePattern(normalizedRoot));
}

static QList<qint64> uniqueIds(QList<qint64> ids) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

static CatalogStore::FileRow fileRowFrom(const QSqlQuery& q) {
    CatalogStore::FileRow row;
    row.id = q.value(0).toLongLong();
    row.path = q.value(1).toString();
    row.size = q.value(2).toLongLong();
    row.mtime = q.value(3).toDouble();
    row.tags = q.value(4).toString();
    return row;
}

static const char* const kFileColumns =
    "f.id, f.path, f.size, f.mtime, "
    "(SELECT GROUP_CONCAT(t.name, ', ') "
    "   FROM tags t JOIN file_tags ft ON ft.tag_id = t.id "
    "  WHERE ft.file_id = f.id) AS tags";

CatalogStore::CatalogStore(QString databasePath, int busyTimeoutMs)
    : m_databasePath(std::move(databasePath)), m_busyTimeoutMs(busyTimeoutMs) {}

bool CatalogStore::initialize(QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return false;

    static const char* const ddl[] = {
        "CREATE TABLE IF NOT EXISTS files("
        "  id INTEGER PRIMARY KEY,"
        "  path TEXT UNIQUE,"
        "  size INTEGER,"
        "  mtime REAL,"
        "  hash TEXT"
        ");",
        "CREATE TABLE IF NOT EXISTS tags("
        "  id INTEGER PRIMARY KEY,"
        "  name TEXT UNIQUE,"
        "  ord INTEGER"
        ");",
        "CREATE TABLE IF NOT EXISTS file_tags("
        "  file_id INTEGER,"
        "  tag_id INTEGER,"
        "  UNIQUE(file_id, tag_id),"
        "  FOREIGN KEY(file_id) REFERENCES files(id) ON DELETE CASCADE,"
        "  FOREIGN KEY(tag_id) REFERENCES tags(id) ON DELETE CASCADE"
        ");",
        "CREATE TABLE IF NOT EXISTS roots("
        "  path TEXT PRIMARY KEY,"
        "  last_scanned REAL"
        ");",
        "CREATE TABLE IF NOT EXISTS settings("
        "  key TEXT PRIMARY KEY,"
        "  value TEXT"
        ");",
        "CREATE INDEX IF NOT EXISTS idx_files_path ON files(path);",
        "CREATE INDEX IF NOT EXISTS idx_files_mtime ON files(mtime);",
        "CREATE INDEX IF NOT EXISTS idx_tags_name ON tags(name);",
        "CREATE INDEX IF NOT EXISTS idx_file_tags_file ON file_tags(file_id);",
        "CREATE INDEX IF NOT EXISTS idx_file_tags_tag ON file_tags(tag_id);",
    };

    CatalogTransaction txn(conn);
    if (!beganOrFail(txn, errorOut)) return false;
    for (const char* sql : ddl) {
        if (!conn.exec(QString::fromLatin1(sql), errorOut)) return false;
    }

    // Databases created before tags had a display order: number them by name
    QList<qint64> unordered;
    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("SELECT id FROM tags WHERE ord IS NULL ORDER BY name;"));
        if (!execOrFail(q, errorOut)) return false;
        while (q.next()) unordered.push_back(q.value(0).toLongLong());
    }

    if (!unordered.isEmpty()) {
        qint64 next = 1;
        {
            QSqlQuery q(conn.database());
            q.prepare(QStringLiteral("SELECT COALESCE(MAX(ord), 0) + 1 FROM tags;"));
            if (!execOrFail(q, errorOut)) return false;
            if (q.next()) next = q.value(0).toLongLong();
        }

        for (qint64 tagId : unordered) {
            QSqlQuery q(conn.database());
            q.prepare(QStringLiteral("UPDATE tags SET ord = ? WHERE id = ?;"));
            q.addBindValue(next++);
            q.addBindValue(tagId);
            if (!execOrFail(q, errorOut)) return false;
        }
        qInfo() << "Assigned display order to" << unordered.size() << "tag(s)";
    }

    return txn.commit(errorOut);
}

CatalogStore::UpsertResult CatalogStore::upsertFile(const QString& path, QString* errorOut) const {
    const QFileInfo info(path);
    if (!info.isFile()) {
        return UpsertResult::SkippedMissing;
    }

    const QString full = Utils::normalizePath(path);
    const qint64 size = info.size();
    const double mtime = Utils::modificationSeconds(info);

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return UpsertResult::Failed;

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral(
        "INSERT INTO files(path, size, mtime, hash) VALUES(?, ?, ?, NULL) "
        "ON CONFLICT(path) DO UPDATE SET size = excluded.size, mtime = excluded.mtime;"));
    q.addBindValue(full);
    q.addBindValue(size);
    q.addBindValue(mtime);
    if (!execOrFail(q, errorOut)) return UpsertResult::Failed;

    return UpsertResult::Written;
}

std::optional<CatalogStore::Fingerprint> CatalogStore::countAndMaxModTime(const QString& root,
                                                                          QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    QSqlQuery q(conn.database());
    const QString normalized = Utils::normalizePath(root);
    if (normalized.isEmpty()) {
        q.prepare(QStringLiteral("SELECT COUNT(*), COALESCE(MAX(mtime), 0) FROM files;"));
    } else {
        q.prepare(QStringLiteral("SELECT COUNT(*), COALESCE(MAX(mtime), 0) FROM files f WHERE ")
                  + underRootClause(QStringLiteral("f.path")) + QStringLiteral(";"));
        bindUnderRoot(q, normalized);
    }
    if (!execOrFail(q, errorOut)) return std::nullopt;

    Fingerprint fp;
    if (q.next()) {
        fp.count = static_cast<quint64>(q.value(0).toLongLong());
        fp.maxMtime = q.value(1).toDouble();
    }
    return fp;
}

std::optional<int> CatalogStore::removeMissingUnder(const QString& root, QString* errorOut) const {
    const QString normalized = Utils::normalizePath(root);
    if (normalized.isEmpty()) {
        setError(errorOut, QStringLiteral("Empty root path"));
        return std::nullopt;
    }

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    QList<qint64> missing;
    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("SELECT f.id, f.path FROM files f WHERE ")
                  + underRootClause(QStringLiteral("f.path")) + QStringLiteral(";"));
        bindUnderRoot(q, normalized);
        if (!execOrFail(q, errorOut)) return std::nullopt;

        while (q.next()) {
            if (!QFileInfo::exists(q.value(1).toString())) {
                missing.push_back(q.value(0).toLongLong());
            }
        }
    }

    if (missing.isEmpty()) return 0;

    CatalogTransaction txn(conn);
    if (!beganOrFail(txn, errorOut)) return std::nullopt;
    int removed = 0;
    for (qint64 fileId : missing) {
        QSqlQuery del(conn.database());
        del.prepare(QStringLiteral("DELETE FROM files WHERE id = ?;"));
        del.addBindValue(fileId);
        if (!execOrFail(del, errorOut)) return std::nullopt;
        removed += del.numRowsAffected() > 0 ? 1 : 0;
    }
    if (!txn.commit(errorOut)) return std::nullopt;

    qDebug().noquote() << "Pruned" << removed << "missing file(s) under" << normalized;
    return removed;
}

std::optional<quint64> CatalogStore::countFiles(const QString& root, QString* errorOut) const {
    const auto fp = countAndMaxModTime(root, errorOut);
    if (!fp) return std::nullopt;
    return fp->count;
}

std::optional<QList<CatalogStore::FileRow>> CatalogStore::listFiles(const FileFilter& filter,
                                                                    QString* errorOut) const {
    QStringList joins;
    QStringList where;
    QVariantList joinBinds;
    QVariantList whereBinds;

    // One join per required tag: a file survives only if it carries all of them
    const QList<qint64> tagIds = uniqueIds(filter.tagIds);
    for (qsizetype i = 0; i < tagIds.size(); ++i) {
        joins << QStringLiteral("JOIN file_tags ft%1 ON ft%1.file_id = f.id AND ft%1.tag_id = ?").arg(i);
        joinBinds << tagIds[i];
    }

    if (!filter.search.isEmpty()) {
        where << QStringLiteral("f.path LIKE ? ESCAPE '\\'");
        whereBinds << QStringLiteral("%") + Utils::escapeLike(filter.search) + QStringLiteral("%");
    }

    if (filter.onlyTagged) {
        where << QStringLiteral("EXISTS (SELECT 1 FROM file_tags x WHERE x.file_id = f.id)");
    }

    const QString root = Utils::normalizePath(filter.rootPrefix);
    if (!root.isEmpty()) {
        where << underRootClause(QStringLiteral("f.path"));
        whereBinds << root << Utils::childrenLikePattern(root);
    }

    QString sql = QStringLiteral("SELECT ") + QString::fromLatin1(kFileColumns) + QStringLiteral(" FROM files f ");
    sql += joins.join(QLatin1Char(' '));
    if (!where.isEmpty()) {
        sql += QStringLiteral(" WHERE ") + where.join(QStringLiteral(" AND "));
    }
    sql += QStringLiteral(" ORDER BY f.path ASC;");

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    QSqlQuery q(conn.database());
    q.setForwardOnly(true);
    q.prepare(sql);
    for (const QVariant& v : joinBinds) q.addBindValue(v);
    for (const QVariant& v : whereBinds) q.addBindValue(v);
    if (!execOrFail(q, errorOut)) return std::nullopt;

    QList<FileRow> rows;
    while (q.next()) {
        rows.push_back(fileRowFrom(q));
    }
    return rows;
}

std::optional<CatalogStore::FileRow> CatalogStore::fileById(qint64 fileId, QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral("SELECT ") + QString::fromLatin1(kFileColumns)
              + QStringLiteral(" FROM files f WHERE f.id = ?;"));
    q.addBindValue(fileId);
    if (!execOrFail(q, errorOut)) return std::nullopt;

    if (!q.next()) {
        setError(errorOut, QStringLiteral("No file with id %1").arg(fileId));
        return std::nullopt;
    }
    return fileRowFrom(q);
}

std::optional<CatalogStore::FileRow> CatalogStore::fileByPath(const QString& path, QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    const QString full = Utils::normalizePath(path);

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral("SELECT ") + QString::fromLatin1(kFileColumns)
              + QStringLiteral(" FROM files f WHERE f.path = ?;"));
    q.addBindValue(full);
    if (!execOrFail(q, errorOut)) return std::nullopt;

    if (!q.next()) {
        setError(errorOut, QStringLiteral("File is not in the catalog: %1").arg(full));
        return std::nullopt;
    }
    return fileRowFrom(q);
}

bool CatalogStore::renameFilePath(const QString& oldPath, const QString& newPath, QString* errorOut) const {
    const QString from = Utils::normalizePath(oldPath);
    const QString to = Utils::normalizePath(newPath);
    if (from.isEmpty() || to.isEmpty()) {
        setError(errorOut, QStringLiteral("Empty path"));
        return false;
    }
    if (from == to) return true;

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return false;

    CatalogTransaction txn(conn);
    if (!beganOrFail(txn, errorOut)) return false;

    // The on-disk rename replaced whatever was at the target, so its row is stale
    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("DELETE FROM files WHERE path = ?;"));
        q.addBindValue(to);
        if (!execOrFail(q, errorOut)) return false;
    }
    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("UPDATE files SET path = ? WHERE path = ?;"));
        q.addBindValue(to);
        q.addBindValue(from);
        if (!execOrFail(q, errorOut)) return false;
    }

    return txn.commit(errorOut);
}

bool CatalogStore::forgetFile(const QString& path, QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return false;

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral("DELETE FROM files WHERE path = ?;"));
    q.addBindValue(Utils::normalizePath(path));
    return execOrFail(q, errorOut);
}

bool CatalogStore::addRoot(const QString& path, QString* errorOut) const {
    const QString root = Utils::normalizePath(path);
    if (root.isEmpty()) {
        setError(errorOut, QStringLiteral("Empty root path"));
        return false;
    }

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return false;

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral(
        "INSERT INTO roots(path, last_scanned) VALUES(?, ?) "
        "ON CONFLICT(path) DO UPDATE SET last_scanned = excluded.last_scanned;"));
    q.addBindValue(root);
    q.addBindValue(static_cast<double>(QDateTime::currentSecsSinceEpoch()));
    return execOrFail(q, errorOut);
}

std::optional<QStringList> CatalogStore::listRoots(QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral("SELECT path FROM roots ORDER BY path;"));
    if (!execOrFail(q, errorOut)) return std::nullopt;

    QStringList roots;
    while (q.next()) {
        const QString root = Utils::normalizePath(q.value(0).toString());
        if (!root.isEmpty()) roots << root;
    }

    // Rows written by older versions may differ only by a trailing separator
    roots.sort();
    roots.removeDuplicates();
    return roots;
}

std::optional<int> CatalogStore::removeRoot(const QString& path, QString* errorOut) const {
    const QString root = Utils::normalizePath(path);
    if (root.isEmpty()) {
        setError(errorOut, QStringLiteral("Empty root path"));
        return std::nullopt;
    }

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    CatalogTransaction txn(conn);
    if (!beganOrFail(txn, errorOut)) return std::nullopt;
    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("DELETE FROM roots WHERE path = ?;"));
        q.addBindValue(root);
        if (!execOrFail(q, errorOut)) return std::nullopt;
    }

    int removed = 0;
    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("DELETE FROM files WHERE ") + underRootClause(QStringLiteral("path"))
                  + QStringLiteral(";"));
        bindUnderRoot(q, root);
        if (!execOrFail(q, errorOut)) return std::nullopt;
        removed = std::max(0, q.numRowsAffected());
    }

    if (!txn.commit(errorOut)) return std::nullopt;

    qInfo().noquote() << "Removed root" << root << "and" << removed << "file record(s)";
    return removed;
}

std::optional<qint64> CatalogStore::ensureTag(const QString& name, QString* errorOut) const {
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) return std::nullopt;

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    CatalogTransaction txn(conn);
    if (!beganOrFail(txn, errorOut)) return std::nullopt;

    qint64 next = 1;
    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("SELECT COALESCE(MAX(ord), 0) + 1 FROM tags;"));
        if (!execOrFail(q, errorOut)) return std::nullopt;
        if (q.next()) next = q.value(0).toLongLong();
    }
    {
        // Existing tags keep their order; the computed value is only used on creation
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("INSERT OR IGNORE INTO tags(name, ord) VALUES(?, ?);"));
        q.addBindValue(trimmed);
        q.addBindValue(next);
        if (!execOrFail(q, errorOut)) return std::nullopt;
    }

    qint64 tagId = 0;
    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("SELECT id FROM tags WHERE name = ?;"));
        q.addBindValue(trimmed);
        if (!execOrFail(q, errorOut)) return std::nullopt;
        if (!q.next()) {
            setError(errorOut, QStringLiteral("Tag vanished after insert: %1").arg(trimmed));
            return std::nullopt;
        }
        tagId = q.value(0).toLongLong();
    }

    if (!txn.commit(errorOut)) return std::nullopt;
    return tagId;
}

std::optional<qint64> CatalogStore::tagIdByName(const QString& name, QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral("SELECT id FROM tags WHERE name = ?;"));
    q.addBindValue(name.trimmed());
    if (!execOrFail(q, errorOut)) return std::nullopt;

    if (!q.next()) {
        setError(errorOut, QStringLiteral("No such tag: %1").arg(name.trimmed()));
        return std::nullopt;
    }
    return q.value(0).toLongLong();
}

std::optional<QList<CatalogStore::TagRow>> CatalogStore::listTags(QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral("SELECT id, name, ord FROM tags ORDER BY ord ASC, name ASC;"));
    if (!execOrFail(q, errorOut)) return std::nullopt;

    QList<TagRow> tags;
    while (q.next()) {
        tags.push_back(TagRow{q.value(0).toLongLong(), q.value(1).toString(), q.value(2).toLongLong()});
    }
    return tags;
}

bool CatalogStore::deleteTags(const QList<qint64>& tagIds, QString* errorOut) const {
    if (tagIds.isEmpty()) return true;

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return false;

    CatalogTransaction txn(conn);
    if (!beganOrFail(txn, errorOut)) return false;
    for (qint64 tagId : tagIds) {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("DELETE FROM tags WHERE id = ?;"));
        q.addBindValue(tagId);
        if (!execOrFail(q, errorOut)) return false;
    }
    return txn.commit(errorOut);
}

CatalogStore::TagRenameResult CatalogStore::renameOrMergeTag(qint64 tagId,
                                                             const QString& newName,
                                                             QString* errorOut) const {
    const QString trimmed = newName.trimmed();
    if (trimmed.isEmpty()) return TagRenameResult::Unchanged;

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return TagRenameResult::Failed;

    CatalogTransaction txn(conn);
    if (!beganOrFail(txn, errorOut)) return TagRenameResult::Failed;

    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("SELECT 1 FROM tags WHERE id = ?;"));
        q.addBindValue(tagId);
        if (!execOrFail(q, errorOut)) return TagRenameResult::Failed;
        if (!q.next()) {
            setError(errorOut, QStringLiteral("No tag with id %1").arg(tagId));
            return TagRenameResult::NotFound;
        }
    }

    std::optional<qint64> existingId;
    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("SELECT id FROM tags WHERE name = ?;"));
        q.addBindValue(trimmed);
        if (!execOrFail(q, errorOut)) return TagRenameResult::Failed;
        if (q.next()) existingId = q.value(0).toLongLong();
    }

    if (existingId) {
        if (*existingId == tagId) return TagRenameResult::Unchanged;

        // Merge: the surviving tag gains every file of the old one, duplicates are ignored
        {
            QSqlQuery q(conn.database());
            q.prepare(QStringLiteral(
                "INSERT OR IGNORE INTO file_tags(file_id, tag_id) "
                "SELECT file_id, ? FROM file_tags WHERE tag_id = ?;"));
            q.addBindValue(*existingId);
            q.addBindValue(tagId);
            if (!execOrFail(q, errorOut)) return TagRenameResult::Failed;
        }
        {
            QSqlQuery q(conn.database());
            q.prepare(QStringLiteral("DELETE FROM file_tags WHERE tag_id = ?;"));
            q.addBindValue(tagId);
            if (!execOrFail(q, errorOut)) return TagRenameResult::Failed;
        }
        {
            QSqlQuery q(conn.database());
            q.prepare(QStringLiteral("DELETE FROM tags WHERE id = ?;"));
            q.addBindValue(tagId);
            if (!execOrFail(q, errorOut)) return TagRenameResult::Failed;
        }

        if (!txn.commit(errorOut)) return TagRenameResult::Failed;
        qInfo().noquote() << "Merged tag" << tagId << "into" << trimmed;
        return TagRenameResult::Merged;
    }

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral("UPDATE tags SET name = ? WHERE id = ?;"));
    q.addBindValue(trimmed);
    q.addBindValue(tagId);
    if (!q.exec()) {
        const QSqlError err = q.lastError();
        setError(errorOut, err.text());
        if (isConstraintViolation(err)) {
            return TagRenameResult::DuplicateName;
        }
        qWarning().noquote() << "Tag rename failed:" << err.text();
        return TagRenameResult::Failed;
    }

    if (!txn.commit(errorOut)) return TagRenameResult::Failed;
    return TagRenameResult::Renamed;
}

bool CatalogStore::moveTag(qint64 tagId, int delta, QString* errorOut) const {
    if (delta == 0) return true;

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return false;

    CatalogTransaction txn(conn);
    if (!beganOrFail(txn, errorOut)) return false;

    qint64 currentOrder = 0;
    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("SELECT ord FROM tags WHERE id = ?;"));
        q.addBindValue(tagId);
        if (!execOrFail(q, errorOut)) return false;
        if (!q.next()) {
            setError(errorOut, QStringLiteral("No tag with id %1").arg(tagId));
            return false;
        }
        currentOrder = q.value(0).toLongLong();
    }

    qint64 neighbourId = 0;
    qint64 neighbourOrder = 0;
    {
        QSqlQuery q(conn.database());
        q.prepare(delta < 0
                      ? QStringLiteral("SELECT id, ord FROM tags WHERE ord < ? ORDER BY ord DESC LIMIT 1;")
                      : QStringLiteral("SELECT id, ord FROM tags WHERE ord > ? ORDER BY ord ASC LIMIT 1;"));
        q.addBindValue(currentOrder);
        if (!execOrFail(q, errorOut)) return false;
        if (!q.next()) {
            return true; // already first / last
        }
        neighbourId = q.value(0).toLongLong();
        neighbourOrder = q.value(1).toLongLong();
    }

    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("UPDATE tags SET ord = ? WHERE id = ?;"));
        q.addBindValue(neighbourOrder);
        q.addBindValue(tagId);
        if (!execOrFail(q, errorOut)) return false;
    }
    {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("UPDATE tags SET ord = ? WHERE id = ?;"));
        q.addBindValue(currentOrder);
        q.addBindValue(neighbourId);
        if (!execOrFail(q, errorOut)) return false;
    }

    return txn.commit(errorOut);
}

std::optional<QList<CatalogStore::TagRow>> CatalogStore::tagsForFile(qint64 fileId, QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral(
        "SELECT t.id, t.name, t.ord "
        "  FROM tags t JOIN file_tags ft ON ft.tag_id = t.id "
        " WHERE ft.file_id = ? ORDER BY t.ord, t.name;"));
    q.addBindValue(fileId);
    if (!execOrFail(q, errorOut)) return std::nullopt;

    QList<TagRow> tags;
    while (q.next()) {
        tags.push_back(TagRow{q.value(0).toLongLong(), q.value(1).toString(), q.value(2).toLongLong()});
    }
    return tags;
}

bool CatalogStore::tagFiles(const QList<qint64>& fileIds, qint64 tagId, QString* errorOut) const {
    if (fileIds.isEmpty()) return true;

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return false;

    CatalogTransaction txn(conn);
    if (!beganOrFail(txn, errorOut)) return false;
    for (qint64 fileId : fileIds) {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("INSERT OR IGNORE INTO file_tags(file_id, tag_id) VALUES(?, ?);"));
        q.addBindValue(fileId);
        q.addBindValue(tagId);
        if (!execOrFail(q, errorOut)) return false;
    }
    return txn.commit(errorOut);
}

bool CatalogStore::untagFile(qint64 fileId, const QList<qint64>& tagIds, QString* errorOut) const {
    if (tagIds.isEmpty()) return true;

    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return false;

    CatalogTransaction txn(conn);
    if (!beganOrFail(txn, errorOut)) return false;
    for (qint64 tagId : tagIds) {
        QSqlQuery q(conn.database());
        q.prepare(QStringLiteral("DELETE FROM file_tags WHERE file_id = ? AND tag_id = ?;"));
        q.addBindValue(fileId);
        q.addBindValue(tagId);
        if (!execOrFail(q, errorOut)) return false;
    }
    return txn.commit(errorOut);
}

std::optional<QHash<qint64, quint64>> CatalogStore::fileCountsByTag(QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral(
        "SELECT t.id, COUNT(ft.file_id) "
        "  FROM tags t LEFT JOIN file_tags ft ON ft.tag_id = t.id "
        " GROUP BY t.id;"));
    if (!execOrFail(q, errorOut)) return std::nullopt;

    QHash<qint64, quint64> counts;
    while (q.next()) {
        counts.insert(q.value(0).toLongLong(), static_cast<quint64>(q.value(1).toLongLong()));
    }
    return counts;
}

std::optional<QString> CatalogStore::setting(const QString& key,
                                             const QString& defaultValue,
                                             QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return std::nullopt;

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral("SELECT value FROM settings WHERE key = ?;"));
    q.addBindValue(key);
    if (!execOrFail(q, errorOut)) return std::nullopt;

    if (!q.next()) return defaultValue;
    return q.value(0).toString();
}

bool CatalogStore::setSetting(const QString& key, const QString& value, QString* errorOut) const {
    CatalogConnection conn(m_databasePath, m_busyTimeoutMs);
    if (!openOrFail(conn, errorOut)) return false;

    QSqlQuery q(conn.database());
    q.prepare(QStringLiteral(
        "INSERT INTO settings(key, value) VALUES(?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value;"));
    q.addBindValue(key);
    q.addBindValue(value);
    return execOrFail(q, errorOut);
}
