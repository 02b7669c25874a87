// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef TAGDECK_TAGDECKD_CATALOGSERVICE_H
#define TAGDECK_TAGDECKD_CATALOGSERVICE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QVariant>
#include <QVariantList>
#include <QVariantMap>

#include <QtDBus/QDBusContext>

#include "../CatalogConfig.h"
#include "../CatalogStore.h"
#include "../ScannerManager.h"

class CatalogService final : public QObject, protected QDBusContext {
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.tagdeck.Catalog1.Catalog")

public:
    explicit CatalogService(const CatalogConfig& config, QObject* parent = nullptr);
    ~CatalogService() override;

    /**
     * Creates the database directory and schema. Must succeed before the object is exported.
     */
    bool initialize(QString* errorOut = nullptr);

public slots:
    /**
     * Provides version information about the CatalogService and its API.
     *
     * @param versionOut Populated with the service version string.
     * @param apiVersionOut Populated with the API version integer.
     */
    void Ping(QString& versionOut, quint32& apiVersionOut) const;

    // ---- Roots ----

    QStringList ListRoots() const;

    // Registers a folder without scanning it. Rejected while a scan is running.
    void AddRoot(const QString& path);

    /**
     * Unregisters a folder and forgets every file below it.
     * Rejected while a scan is running.
     *
     * @return the number of file records removed.
     */
    quint32 RemoveRoot(const QString& path);

    /**
     * Brings one folder up to date.
     *
     * @return "started" when a walk was launched (ScanProgress / ScanFinished follow) or
     *         "upToDate" when nothing changed (ScanFinished was already emitted).
     *         A running scan or an unreadable catalog is reported as a D-Bus error.
     */
    QString Reconcile(const QString& root);

    // Walks every registered folder in one pass. Returns "started".
    QString ReconcileAll();

    bool IsScanning() const;

    // ---- Files ----

    /**
     * Lists catalog files matching every given criterion, ordered by path.
     *
     * @param search Case sensitive substring of the path; empty matches all.
     * @param tagIds Tag ids (int64 values); a file must carry all of them.
     * @param onlyTagged Only files that carry at least one tag.
     * @param rootPrefix Only files under this folder; empty for all folders.
     * @return rows of [id:int64, path:string, size:int64, mtime:double, tags:string]
     */
    QVariantList ListFiles(const QString& search,
                           const QVariantList& tagIds,
                           bool onlyTagged,
                           const QString& rootPrefix) const;

    quint64 CountFiles(const QString& rootPrefix) const;

    // One row as in ListFiles(), or a D-Bus error when the path is not catalogued.
    QVariantList FileByPath(const QString& path) const;

    /**
     * Renames a file on disk inside its own directory, then moves its catalog row.
     *
     * @param newName The new file name only, without any directory part.
     * @return the new absolute path.
     */
    QString RenameFile(const QString& path, const QString& newName);

    // Drops the catalog row for `path`; the file on disk is untouched.
    void ForgetFile(const QString& path);

    // ---- Tags ----

    // rows of [id:int64, name:string, order:int64, fileCount:uint64] in display order
    QVariantList ListTags() const;

    qint64 EnsureTag(const QString& name);

    // "renamed", "merged" or "unchanged"
    QString RenameTag(qint64 tagId, const QString& newName);

    void DeleteTags(const QVariantList& tagIds);

    // delta < 0 moves the tag one place up, delta > 0 one place down
    void MoveTag(qint64 tagId, int delta);

    // Creates the tag if needed and attaches it to every file id given.
    void TagFiles(const QVariantList& fileIds, const QString& tagName);

    void UntagFile(qint64 fileId, const QVariantList& tagIds);

    // rows of [id:int64, name:string]
    QVariantList FileTags(qint64 fileId) const;

    // ---- Settings ----

    QString GetSetting(const QString& key, const QString& defaultValue) const;
    void SetSetting(const QString& key, const QString& value);

signals:
    void ScanStarted(quint64 total, const QString& purpose);
    void ScanProgress(quint64 processed, quint64 total);
    void ScanFinished(const QVariantMap& summary);

    // emitted after anything that changes files, tags or roots
    void CatalogChanged();

private:
    void replyError(const QString& message) const;
    bool rejectWhileScanning(const QString& action) const;

    [[nodiscard]] static QList<qint64> idsFromVariants(const QVariantList& values);
    [[nodiscard]] static QVariantList fileRowToVariant(const CatalogStore::FileRow& row);
    [[nodiscard]] static QVariantMap summaryToVariant(const ScannerEngine::BatchSummary& summary);

    CatalogStore m_store;
    ScannerManager m_scanner;
    QString m_lastScanError;
};

#endif //TAGDECK_TAGDECKD_CATALOGSERVICE_H
