// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef TAGDECK_CATALOGSTORE_H
#define TAGDECK_CATALOGSTORE_H

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

/**
 * @brief Persistent catalog of files, tags, tagged-file links, indexed roots and settings.
 *
 * Backed by one SQLite file. The store keeps no open handle: every call opens its own
 * CatalogConnection and releases it before returning, so the object can be shared by the
 * foreground thread and the reconciler's worker thread.
 *
 * Failures of the database itself are reported through the return value (false,
 * std::nullopt or a Failed result) and, when errorOut is given, the driver's message.
 * All paths are normalized with Utils::normalizePath before they reach SQL.
 */
class CatalogStore {
public:
    struct FileRow {
        qint64 id = 0;
        QString path;
        qint64 size = 0;
        double mtime = 0.0; // seconds since epoch
        QString tags;       // comma-joined tag names, empty if untagged
    };

    struct TagRow {
        qint64 id = 0;
        QString name;
        qint64 order = 0;
    };

    // Cheap summary of a set of files: how many, and the newest modification time.
    struct Fingerprint {
        quint64 count = 0;
        double maxMtime = 0.0;
    };

    struct FileFilter {
        QString search;         // substring of the path; empty matches everything
        QList<qint64> tagIds;   // a file must carry EVERY one of these
        bool onlyTagged = false;
        QString rootPrefix;     // empty = all roots
    };

    enum class UpsertResult { Written, SkippedMissing, Failed };

    enum class TagRenameResult { Renamed, Merged, Unchanged, DuplicateName, NotFound, Failed };

    explicit CatalogStore(QString databasePath, int busyTimeoutMs = 5000);

    [[nodiscard]] const QString& databasePath() const { return m_databasePath; }

    /**
     * Creates tables and indexes if they are missing and gives every tag that has no
     * display order one (sequential, by name). Safe to call on every start.
     */
    bool initialize(QString* errorOut = nullptr) const;

    // ---- Files ----

    /**
     * Inserts the file, or refreshes size and mtime of the row with the same normalized path.
     *
     * A path that is not (or no longer) an existing regular file is a silent no-op reported as
     * SkippedMissing: the filesystem may change between enumeration and this call.
     * The hash column is never written.
     */
    UpsertResult upsertFile(const QString& path, QString* errorOut = nullptr) const;

    /**
     * Count and newest mtime of the catalog rows, either all of them or those under `root`.
     * maxMtime is 0 when there are no rows.
     */
    [[nodiscard]] std::optional<Fingerprint> countAndMaxModTime(const QString& root = {},
                                                                QString* errorOut = nullptr) const;

    /**
     * Deletes every row under `root` whose path no longer exists on disk.
     * @return the number of rows removed.
     */
    std::optional<int> removeMissingUnder(const QString& root, QString* errorOut = nullptr) const;

    [[nodiscard]] std::optional<quint64> countFiles(const QString& root = {}, QString* errorOut = nullptr) const;

    /**
     * Files matching every criterion of `filter`, ordered by path ascending.
     */
    [[nodiscard]] std::optional<QList<FileRow>> listFiles(const FileFilter& filter,
                                                          QString* errorOut = nullptr) const;

    [[nodiscard]] std::optional<FileRow> fileById(qint64 fileId, QString* errorOut = nullptr) const;
    [[nodiscard]] std::optional<FileRow> fileByPath(const QString& path, QString* errorOut = nullptr) const;

    // Moves a row to a new path after an on-disk rename; id and tags are kept.
    bool renameFilePath(const QString& oldPath, const QString& newPath, QString* errorOut = nullptr) const;

    // Drops the row for `path` (and its tag links). Missing rows are not an error.
    bool forgetFile(const QString& path, QString* errorOut = nullptr) const;

    // ---- Roots ----

    // Registers the root, or refreshes its last-scanned time if already known.
    bool addRoot(const QString& path, QString* errorOut = nullptr) const;

    // Registered roots, normalized, deduplicated and sorted.
    [[nodiscard]] std::optional<QStringList> listRoots(QString* errorOut = nullptr) const;

    /**
     * Unregisters the root and deletes every file row under it.
     * @return the number of file rows deleted.
     */
    std::optional<int> removeRoot(const QString& path, QString* errorOut = nullptr) const;

    // ---- Tags ----

    /**
     * Get-or-create by name. Whitespace is trimmed; an empty name yields std::nullopt with
     * errorOut left untouched. A new tag is placed after every existing one.
     */
    std::optional<qint64> ensureTag(const QString& name, QString* errorOut = nullptr) const;

    [[nodiscard]] std::optional<qint64> tagIdByName(const QString& name, QString* errorOut = nullptr) const;

    // Ordered by display order, then name.
    [[nodiscard]] std::optional<QList<TagRow>> listTags(QString* errorOut = nullptr) const;

    bool deleteTags(const QList<qint64>& tagIds, QString* errorOut = nullptr) const;

    /**
     * Renames a tag. When another tag already has `newName`, the two are merged: the other tag
     * gains every file of `tagId` and `tagId` is deleted.
     */
    TagRenameResult renameOrMergeTag(qint64 tagId, const QString& newName, QString* errorOut = nullptr) const;

    /**
     * Swaps the display order with the nearest tag before (delta < 0) or after (delta > 0).
     * Moving past either end is a no-op.
     */
    bool moveTag(qint64 tagId, int delta, QString* errorOut = nullptr) const;

    [[nodiscard]] std::optional<QList<TagRow>> tagsForFile(qint64 fileId, QString* errorOut = nullptr) const;

    // Links every file to the tag; existing links are left alone.
    bool tagFiles(const QList<qint64>& fileIds, qint64 tagId, QString* errorOut = nullptr) const;

    bool untagFile(qint64 fileId, const QList<qint64>& tagIds, QString* errorOut = nullptr) const;

    // tagId -> number of files carrying it (0 for unused tags).
    [[nodiscard]] std::optional<QHash<qint64, quint64>> fileCountsByTag(QString* errorOut = nullptr) const;

    // ---- Settings ----

    [[nodiscard]] std::optional<QString> setting(const QString& key,
                                                 const QString& defaultValue = {},
                                                 QString* errorOut = nullptr) const;
    bool setSetting(const QString& key, const QString& value, QString* errorOut = nullptr) const;

private:
    QString m_databasePath;
    int m_busyTimeoutMs = 5000;
};

#endif //TAGDECK_CATALOGSTORE_H
