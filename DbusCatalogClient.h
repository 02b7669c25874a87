// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef TAGDECK_DBUSCATALOGCLIENT_H
#define TAGDECK_DBUSCATALOGCLIENT_H

#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantList>
#include <QVariantMap>
#include <optional>

/**
 * Thin synchronous proxy for the tagdeckd CatalogService on the session bus.
 * Every call returns std::nullopt / false on failure and puts the D-Bus error text in errorOut.
 */
class DbusCatalogClient final : public QObject {
    Q_OBJECT

public:
    struct PingResult {
        QString version;
        quint32 apiVersion = 0;
    };

    struct FileEntry {
        qint64 id = 0;
        QString path;
        qint64 size = 0;
        double mtime = 0.0;
        QString tags;
    };

    struct TagEntry {
        qint64 id = 0;
        QString name;
        qint64 order = 0;
        quint64 fileCount = 0;
    };

    explicit DbusCatalogClient(QObject* parent = nullptr);

    [[nodiscard]] bool isAvailable() const;

    std::optional<PingResult> ping(QString* errorOut = nullptr) const;

    std::optional<QStringList> listRoots(QString* errorOut = nullptr) const;
    bool addRoot(const QString& path, QString* errorOut = nullptr) const;
    std::optional<quint32> removeRoot(const QString& path, QString* errorOut = nullptr) const;

    // "started" or "upToDate"
    std::optional<QString> reconcile(const QString& root, QString* errorOut = nullptr) const;
    std::optional<QString> reconcileAll(QString* errorOut = nullptr) const;
    std::optional<bool> isScanning(QString* errorOut = nullptr) const;

    std::optional<QList<FileEntry>> listFiles(const QString& search,
                                              const QList<qint64>& tagIds,
                                              bool onlyTagged,
                                              const QString& rootPrefix,
                                              QString* errorOut = nullptr) const;
    std::optional<quint64> countFiles(const QString& rootPrefix, QString* errorOut = nullptr) const;
    std::optional<FileEntry> fileByPath(const QString& path, QString* errorOut = nullptr) const;
    std::optional<QString> renameFile(const QString& path, const QString& newName, QString* errorOut = nullptr) const;
    bool forgetFile(const QString& path, QString* errorOut = nullptr) const;

    std::optional<QList<TagEntry>> listTags(QString* errorOut = nullptr) const;
    std::optional<qint64> ensureTag(const QString& name, QString* errorOut = nullptr) const;
    std::optional<QString> renameTag(qint64 tagId, const QString& newName, QString* errorOut = nullptr) const;
    bool deleteTags(const QList<qint64>& tagIds, QString* errorOut = nullptr) const;
    bool moveTag(qint64 tagId, int delta, QString* errorOut = nullptr) const;
    bool tagFiles(const QList<qint64>& fileIds, const QString& tagName, QString* errorOut = nullptr) const;
    bool untagFile(qint64 fileId, const QList<qint64>& tagIds, QString* errorOut = nullptr) const;

    // id and name only
    std::optional<QList<TagEntry>> fileTags(qint64 fileId, QString* errorOut = nullptr) const;

    std::optional<QString> setting(const QString& key, const QString& defaultValue = {},
                                   QString* errorOut = nullptr) const;
    bool setSetting(const QString& key, const QString& value, QString* errorOut = nullptr) const;

    // Starts forwarding the service's scan signals as scanStarted/scanProgress/scanFinished.
    bool subscribeScanSignals(QString* errorOut = nullptr);

signals:
    void scanStarted(quint64 total, const QString& purpose);
    void scanProgress(quint64 processed, quint64 total);
    void scanFinished(const QVariantMap& summary);

private slots:
    void onScanStarted(quint64 total, const QString& purpose);
    void onScanProgress(quint64 processed, quint64 total);
    void onScanFinished(const QVariantMap& summary);

private:
    // Calls `method` and checks the reply carries at least `minReplyArgs` values.
    std::optional<QVariantList> callMethod(const QString& method,
                                           const QVariantList& args,
                                           int minReplyArgs,
                                           QString* errorOut) const;

    QString m_service;
    QString m_path;
    QString m_iface;
};

#endif //TAGDECK_DBUSCATALOGCLIENT_H
