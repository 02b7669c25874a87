// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <QDebug>
#include <QFileInfo>
#include <QMetaObject>
#include <QThread>
#include <utility>
#include "ScannerManager.h"
#include "Utils.h"

ScannerManager::ScannerManager(CatalogStore store, QObject *parent)
    : QObject(parent), m_store(std::move(store)) {}

ScannerManager::~ScannerManager() {
    // No cancellation: a walk in flight is allowed to finish. Its queued completion is
    // dropped together with this object.
    if (m_worker) {
        m_worker->wait();
    }
}

bool ScannerManager::rejectIfBusy() {
    if (!isRunning()) return false;

    qDebug().noquote() << "Scan request rejected, busy with:" << m_purpose;
    Q_EMIT errorMessage(QStringLiteral("Scan Already Running"),
                        QStringLiteral("Please wait for the current task to finish: %1").arg(m_purpose));
    return true;
}

ScannerManager::StartResult ScannerManager::reconcile(const QString &root) {
    if (rejectIfBusy()) return StartResult::Busy;

    const QString normalized = Utils::normalizePath(root);
    if (normalized.isEmpty()) {
        Q_EMIT errorMessage(QStringLiteral("Invalid Folder"), QStringLiteral("No folder was given."));
        return StartResult::Failed;
    }

    const QFileInfo rootInfo(normalized);
    if (rootInfo.exists() && !rootInfo.isDir()) {
        Q_EMIT errorMessage(QStringLiteral("Invalid Folder"), QStringLiteral("Not a folder: %1").arg(normalized));
        return StartResult::Failed;
    }

    Q_EMIT progressMessage(QStringLiteral("Checking %1 for changes...").arg(normalized));

    const ScannerEngine::DiskFingerprint disk = ScannerEngine::fingerprintDirectory(normalized);

    QString err;
    const auto stored = m_store.countAndMaxModTime(normalized, &err);
    if (!stored) {
        Q_EMIT errorMessage(QStringLiteral("Catalog Error"),
                            QStringLiteral("Could not read the catalog:\n\n%1").arg(err));
        return StartResult::Failed;
    }

    // A vanished folder is only worth walking when it left rows behind to prune
    if (!rootInfo.exists() && stored->count == 0) {
        Q_EMIT errorMessage(QStringLiteral("Invalid Folder"),
                            QStringLiteral("Folder does not exist: %1").arg(normalized));
        return StartResult::Failed;
    }

    qDebug().noquote() << "Fingerprint of" << normalized << "- disk:" << disk.count << disk.maxMtime
                       << "catalog:" << stored->count << stored->maxMtime;

    if (disk.count == stored->count && stored->maxMtime >= disk.maxMtime) {
        ScannerEngine::BatchSummary summary;
        summary.upToDate = true;
        summary.total = disk.count;
        summary.roots = QStringList{normalized};

        Q_EMIT progressMessage(QStringLiteral("%1 is up to date.").arg(normalized));
        Q_EMIT scannerFinished(summary);
        return StartResult::UpToDate;
    }

    if (!m_store.addRoot(normalized, &err)) {
        Q_EMIT errorMessage(QStringLiteral("Catalog Error"),
                            QStringLiteral("Could not register %1:\n\n%2").arg(normalized, err));
        return StartResult::Failed;
    }

    startWorker(QStringList{normalized},
                disk.count,
                ScannerEngine::progressStep(disk.count),
                QStringLiteral("Indexing %1").arg(normalized));
    return StartResult::Started;
}

ScannerManager::StartResult ScannerManager::reconcileAll(const QStringList &roots) {
    if (rejectIfBusy()) return StartResult::Busy;

    QStringList requested = roots;
    if (requested.isEmpty()) {
        QString err;
        const auto registered = m_store.listRoots(&err);
        if (!registered) {
            Q_EMIT errorMessage(QStringLiteral("Catalog Error"),
                                QStringLiteral("Could not read the list of folders:\n\n%1").arg(err));
            return StartResult::Failed;
        }
        requested = *registered;
    }

    // A root listed twice would be counted twice in the combined total
    const QStringList unique = ScannerEngine::uniqueRoots(requested);
    if (unique.isEmpty()) {
        Q_EMIT errorMessage(QStringLiteral("Nothing To Scan"), QStringLiteral("No folders have been added yet."));
        return StartResult::Failed;
    }

    Q_EMIT progressMessage(QStringLiteral("Counting files in %1 folder(s)...").arg(unique.size()));

    quint64 total = 0;
    for (const QString &root : unique) {
        total += ScannerEngine::fingerprintDirectory(root).count;
    }

    for (const QString &root : unique) {
        QString err;
        if (!m_store.addRoot(root, &err)) {
            Q_EMIT errorMessage(QStringLiteral("Catalog Error"),
                                QStringLiteral("Could not register %1:\n\n%2").arg(root, err));
            return StartResult::Failed;
        }
    }

    startWorker(unique, total, m_allRootsInterval, QStringLiteral("Re-indexing all folders"));
    return StartResult::Started;
}

void ScannerManager::startWorker(const QStringList &roots, quint64 total, quint64 step, const QString &purpose) {
    m_state = State::Scanning;
    m_purpose = purpose;

    // Zero files still completes normally; 1 keeps percentage math defined
    const quint64 reportedTotal = std::max<quint64>(1, total);

    qInfo().noquote() << purpose << "-" << total << "file(s) in" << roots.join(QStringLiteral(", "));
    Q_EMIT scannerStarted(reportedTotal, purpose);
    Q_EMIT progressMessage(purpose + QStringLiteral("..."));

    // The worker gets its own copy of the store; every call opens a connection on the worker thread
    const CatalogStore store = m_store;

    QThread *worker = QThread::create([this, store, roots, reportedTotal, step]() {
        ScannerEngine::BatchSummary summary;
        summary.total = reportedTotal;
        summary.roots = roots;

        ScannerEngine::ProgressTracker tracker(reportedTotal, step, [this](quint64 processed, quint64 total) {
            QMetaObject::invokeMethod(this, [this, processed, total]() {
                Q_EMIT progressValue(processed, total);
            }, Qt::QueuedConnection);
        });

        for (const QString &root : roots) {
            ScannerEngine::walkAndUpsert(store, root, tracker, summary);

            QString err;
            const auto removed = store.removeMissingUnder(root, &err);
            if (removed) {
                summary.removed += static_cast<quint64>(*removed);
            } else {
                qWarning().noquote() << "Could not prune" << root << ":" << err;
            }
        }

        tracker.finish();

        QMetaObject::invokeMethod(this, [this, summary]() {
            finishScan(summary);
        }, Qt::QueuedConnection);
    });

    connect(worker, &QThread::finished, worker, &QObject::deleteLater);
    m_worker = worker;
    worker->start();
}

void ScannerManager::finishScan(const ScannerEngine::BatchSummary &summary) {
    qInfo().noquote() << m_purpose << "finished:" << summary.upserted << "recorded,"
                      << summary.skippedMissing << "vanished," << summary.skippedErrors << "failed,"
                      << summary.removed << "pruned";

    m_state = State::Idle;
    m_purpose.clear();

    Q_EMIT progressMessage(QStringLiteral("Done: %1 file(s) recorded, %2 removed.")
                               .arg(summary.upserted)
                               .arg(summary.removed));
    Q_EMIT scannerFinished(summary);
}
