// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "CatalogService.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <QtDBus/QDBusError>
#include <QtDBus/QDBusVariant>

#include "../Utils.h"
#include "../Version.h"

CatalogService::CatalogService(const CatalogConfig& config, QObject* parent)
    : QObject(parent),
      m_store(config.databasePath, config.busyTimeoutMs),
      m_scanner(m_store, this) {
    m_scanner.setAllRootsProgressInterval(static_cast<quint64>(config.allRootsProgressInterval));

    connect(&m_scanner, &ScannerManager::scannerStarted, this, [this](quint64 total, const QString& purpose) {
        Q_EMIT ScanStarted(total, purpose);
    });

    connect(&m_scanner, &ScannerManager::progressValue, this, [this](quint64 processed, quint64 total) {
        Q_EMIT ScanProgress(processed, total);
    });

    connect(&m_scanner, &ScannerManager::scannerFinished, this, [this](const ScannerEngine::BatchSummary& summary) {
        Q_EMIT ScanFinished(summaryToVariant(summary));
        if (!summary.upToDate) {
            Q_EMIT CatalogChanged();
        }
    });

    connect(&m_scanner, &ScannerManager::progressMessage, this, [](const QString& message) {
        qDebug().noquote() << message;
    });

    // Remembered so the D-Bus reply of the request that triggered it can carry the text
    connect(&m_scanner, &ScannerManager::errorMessage, this, [this](const QString& title, const QString& message) {
        qWarning().noquote() << title << "-" << message;
        m_lastScanError = message;
    });
}

CatalogService::~CatalogService() = default;

bool CatalogService::initialize(QString* errorOut) {
    const QFileInfo dbInfo(m_store.databasePath());
    if (!QDir().mkpath(dbInfo.absolutePath())) {
        if (errorOut) *errorOut = QStringLiteral("Cannot create directory %1").arg(dbInfo.absolutePath());
        return false;
    }

    if (!m_store.initialize(errorOut)) {
        return false;
    }

    qInfo().noquote() << "Catalog database:" << dbInfo.absoluteFilePath();
    return true;
}

void CatalogService::replyError(const QString& message) const {
    qWarning().noquote() << "Request failed:" << message;
    if (calledFromDBus()) {
        sendErrorReply(QDBusError::Failed, message);
    }
}

bool CatalogService::rejectWhileScanning(const QString& action) const {
    if (!m_scanner.isRunning()) return false;

    replyError(QStringLiteral("Cannot %1 while a scan is running (%2).").arg(action, m_scanner.currentPurpose()));
    return true;
}

QList<qint64> CatalogService::idsFromVariants(const QVariantList& values) {
    QList<qint64> ids;
    ids.reserve(values.size());
    for (const QVariant& raw : values) {
        const QVariant v = raw.canConvert<QDBusVariant>() ? qvariant_cast<QDBusVariant>(raw).variant() : raw;

        bool ok = false;
        const qint64 id = v.toLongLong(&ok);
        if (ok) ids.push_back(id);
    }
    return ids;
}

QVariantList CatalogService::fileRowToVariant(const CatalogStore::FileRow& row) {
    QVariantList out;
    out.reserve(5);
    out << QVariant::fromValue(row.id)
        << row.path
        << QVariant::fromValue(row.size)
        << row.mtime
        << row.tags;
    return out;
}

QVariantMap CatalogService::summaryToVariant(const ScannerEngine::BatchSummary& summary) {
    QVariantMap m;
    m.insert(QStringLiteral("processed"), QVariant::fromValue(summary.processed));
    m.insert(QStringLiteral("upserted"), QVariant::fromValue(summary.upserted));
    m.insert(QStringLiteral("skippedMissing"), QVariant::fromValue(summary.skippedMissing));
    m.insert(QStringLiteral("skippedErrors"), QVariant::fromValue(summary.skippedErrors));
    m.insert(QStringLiteral("removed"), QVariant::fromValue(summary.removed));
    m.insert(QStringLiteral("total"), QVariant::fromValue(summary.total));
    m.insert(QStringLiteral("upToDate"), summary.upToDate);
    m.insert(QStringLiteral("roots"), summary.roots);
    return m;
}

void CatalogService::Ping(QString& versionOut, quint32& apiVersionOut) const {
    versionOut = QString::fromUtf8(Version::VERSION);
    apiVersionOut = Version::API_VERSION;
}

QStringList CatalogService::ListRoots() const {
    QString err;
    const auto roots = m_store.listRoots(&err);
    if (!roots) {
        replyError(err);
        return {};
    }
    return *roots;
}

void CatalogService::AddRoot(const QString& path) {
    if (rejectWhileScanning(QStringLiteral("add a folder"))) return;

    const QString root = Utils::normalizePath(path);
    if (!QFileInfo(root).isDir()) {
        replyError(QStringLiteral("Not a directory: %1").arg(path));
        return;
    }

    QString err;
    if (!m_store.addRoot(root, &err)) {
        replyError(err);
        return;
    }
    Q_EMIT CatalogChanged();
}

quint32 CatalogService::RemoveRoot(const QString& path) {
    if (rejectWhileScanning(QStringLiteral("remove a folder"))) return 0;

    QString err;
    const auto removed = m_store.removeRoot(path, &err);
    if (!removed) {
        replyError(err);
        return 0;
    }
    Q_EMIT CatalogChanged();
    return static_cast<quint32>(*removed);
}

QString CatalogService::Reconcile(const QString& root) {
    m_lastScanError.clear();

    switch (m_scanner.reconcile(root)) {
        case ScannerManager::StartResult::Started:
            return QStringLiteral("started");
        case ScannerManager::StartResult::UpToDate:
            return QStringLiteral("upToDate");
        case ScannerManager::StartResult::Busy:
        case ScannerManager::StartResult::Failed:
            break;
    }

    replyError(m_lastScanError.isEmpty() ? QStringLiteral("Scan could not be started") : m_lastScanError);
    return {};
}

QString CatalogService::ReconcileAll() {
    m_lastScanError.clear();

    if (m_scanner.reconcileAll() == ScannerManager::StartResult::Started) {
        return QStringLiteral("started");
    }

    replyError(m_lastScanError.isEmpty() ? QStringLiteral("Scan could not be started") : m_lastScanError);
    return {};
}

bool CatalogService::IsScanning() const {
    return m_scanner.isRunning();
}

QVariantList CatalogService::ListFiles(const QString& search,
                                       const QVariantList& tagIds,
                                       bool onlyTagged,
                                       const QString& rootPrefix) const {
    CatalogStore::FileFilter filter;
    filter.search = search.trimmed();
    filter.tagIds = idsFromVariants(tagIds);
    filter.onlyTagged = onlyTagged;
    filter.rootPrefix = rootPrefix;

    QString err;
    const auto rows = m_store.listFiles(filter, &err);
    if (!rows) {
        replyError(err);
        return {};
    }

    QVariantList out;
    out.reserve(rows->size());
    for (const auto& row : *rows) {
        out.push_back(QVariant(fileRowToVariant(row)));
    }
    return out;
}

quint64 CatalogService::CountFiles(const QString& rootPrefix) const {
    QString err;
    const auto count = m_store.countFiles(rootPrefix, &err);
    if (!count) {
        replyError(err);
        return 0;
    }
    return *count;
}

QVariantList CatalogService::FileByPath(const QString& path) const {
    QString err;
    const auto row = m_store.fileByPath(path, &err);
    if (!row) {
        replyError(err);
        return {};
    }
    return fileRowToVariant(*row);
}

QString CatalogService::RenameFile(const QString& path, const QString& newName) {
    const QString trimmed = newName.trimmed();
    if (trimmed.isEmpty() || trimmed.contains(QLatin1Char('/')) ||
        trimmed == QStringLiteral(".") || trimmed == QStringLiteral("..")) {
        replyError(QStringLiteral("Invalid file name: %1").arg(newName));
        return {};
    }

    QString err;
    const auto row = m_store.fileByPath(path, &err);
    if (!row) {
        replyError(err);
        return {};
    }

    const QString from = row->path;
    const QString to = QFileInfo(from).absoluteDir().filePath(trimmed);
    if (from == to) return from;

    if (QFileInfo::exists(to)) {
        replyError(QStringLiteral("A file named %1 already exists.").arg(trimmed));
        return {};
    }

    QFile file(from);
    if (!file.rename(to)) {
        replyError(QStringLiteral("Could not rename %1: %2").arg(from, file.errorString()));
        return {};
    }

    if (!m_store.renameFilePath(from, to, &err)) {
        replyError(QStringLiteral("Renamed on disk, but the catalog could not be updated: %1").arg(err));
        return {};
    }

    qInfo().noquote() << "Renamed" << from << "->" << to;
    Q_EMIT CatalogChanged();
    return to;
}

void CatalogService::ForgetFile(const QString& path) {
    QString err;
    if (!m_store.forgetFile(path, &err)) {
        replyError(err);
        return;
    }
    Q_EMIT CatalogChanged();
}

QVariantList CatalogService::ListTags() const {
    QString err;
    const auto tags = m_store.listTags(&err);
    if (!tags) {
        replyError(err);
        return {};
    }

    const auto counts = m_store.fileCountsByTag(&err);
    if (!counts) {
        replyError(err);
        return {};
    }

    QVariantList out;
    out.reserve(tags->size());
    for (const auto& tag : *tags) {
        QVariantList row;
        row << QVariant::fromValue(tag.id)
            << tag.name
            << QVariant::fromValue(tag.order)
            << QVariant::fromValue(counts->value(tag.id, 0));
        out.push_back(QVariant(row));
    }
    return out;
}

qint64 CatalogService::EnsureTag(const QString& name) {
    QString err;
    const auto tagId = m_store.ensureTag(name, &err);
    if (!tagId) {
        replyError(err.isEmpty() ? QStringLiteral("Tag name is empty") : err);
        return 0;
    }
    Q_EMIT CatalogChanged();
    return *tagId;
}

QString CatalogService::RenameTag(qint64 tagId, const QString& newName) {
    QString err;
    switch (m_store.renameOrMergeTag(tagId, newName, &err)) {
        case CatalogStore::TagRenameResult::Renamed:
            Q_EMIT CatalogChanged();
            return QStringLiteral("renamed");
        case CatalogStore::TagRenameResult::Merged:
            Q_EMIT CatalogChanged();
            return QStringLiteral("merged");
        case CatalogStore::TagRenameResult::Unchanged:
            return QStringLiteral("unchanged");
        case CatalogStore::TagRenameResult::DuplicateName:
            replyError(QStringLiteral("A tag named %1 already exists.").arg(newName.trimmed()));
            return {};
        case CatalogStore::TagRenameResult::NotFound:
        case CatalogStore::TagRenameResult::Failed:
            break;
    }

    replyError(err);
    return {};
}

void CatalogService::DeleteTags(const QVariantList& tagIds) {
    QString err;
    if (!m_store.deleteTags(idsFromVariants(tagIds), &err)) {
        replyError(err);
        return;
    }
    Q_EMIT CatalogChanged();
}

void CatalogService::MoveTag(qint64 tagId, int delta) {
    QString err;
    if (!m_store.moveTag(tagId, delta, &err)) {
        replyError(err);
        return;
    }
    Q_EMIT CatalogChanged();
}

void CatalogService::TagFiles(const QVariantList& fileIds, const QString& tagName) {
    QString err;
    const auto tagId = m_store.ensureTag(tagName, &err);
    if (!tagId) {
        replyError(err.isEmpty() ? QStringLiteral("Tag name is empty") : err);
        return;
    }

    if (!m_store.tagFiles(idsFromVariants(fileIds), *tagId, &err)) {
        replyError(err);
        return;
    }
    Q_EMIT CatalogChanged();
}

void CatalogService::UntagFile(qint64 fileId, const QVariantList& tagIds) {
    QString err;
    if (!m_store.untagFile(fileId, idsFromVariants(tagIds), &err)) {
        replyError(err);
        return;
    }
    Q_EMIT CatalogChanged();
}

QVariantList CatalogService::FileTags(qint64 fileId) const {
    QString err;
    const auto tags = m_store.tagsForFile(fileId, &err);
    if (!tags) {
        replyError(err);
        return {};
    }

    QVariantList out;
    out.reserve(tags->size());
    for (const auto& tag : *tags) {
        out.push_back(QVariant(QVariantList{QVariant::fromValue(tag.id), tag.name}));
    }
    return out;
}

QString CatalogService::GetSetting(const QString& key, const QString& defaultValue) const {
    QString err;
    const auto value = m_store.setting(key, defaultValue, &err);
    if (!value) {
        replyError(err);
        return {};
    }
    return *value;
}

void CatalogService::SetSetting(const QString& key, const QString& value) {
    QString err;
    if (!m_store.setSetting(key, value, &err)) {
        replyError(err);
    }
}
