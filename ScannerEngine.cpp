// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <utility>
#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>
#include "ScannerEngine.h"
#include "CatalogStore.h"
#include "Utils.h"

namespace ScannerEngine {
    // Regular files (and symlinks to them), dotfiles included; broken links are System entries and stay out
    static const QDir::Filters kWalkFilters = QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot;

    void BatchSummary::record(FileOutcome outcome) {
        ++processed;
        switch (outcome) {
            case FileOutcome::Upserted:
                ++upserted;
                break;
            case FileOutcome::SkippedMissing:
                ++skippedMissing;
                break;
            case FileOutcome::SkippedStorageError:
                ++skippedErrors;
                break;
        }
    }

    ProgressTracker::ProgressTracker(quint64 total, quint64 step, ProgressCallback callback)
        : m_total(std::max<quint64>(1, total)),
          m_step(std::max<quint64>(1, step)),
          m_callback(std::move(callback)) {}

    void ProgressTracker::advance() {
        ++m_processed;
        if (m_processed % m_step == 0 || m_processed == m_total) {
            report(std::min(m_processed, m_total));
        }
    }

    void ProgressTracker::finish() {
        report(m_total);
    }

    void ProgressTracker::report(quint64 value) {
        if (value <= m_lastReported) return;
        m_lastReported = value;
        if (m_callback) m_callback(value, m_total);
    }

    DiskFingerprint fingerprintDirectory(const QString& root) {
        DiskFingerprint fp;

        QDirIterator it(root, kWalkFilters, QDirIterator::Subdirectories);
        while (it.hasNext()) {
            it.next();

            QFileInfo info = it.fileInfo();
            info.refresh();
            if (!info.exists() || !info.isFile()) {
                continue;
            }

            ++fp.count;
            fp.maxMtime = std::max(fp.maxMtime, Utils::modificationSeconds(info));
        }

        return fp;
    }

    quint64 progressStep(quint64 total) {
        return std::max<quint64>(1, total / 100);
    }

    FileOutcome upsertOne(const CatalogStore& store, const QString& path) {
        QString err;
        switch (store.upsertFile(path, &err)) {
            case CatalogStore::UpsertResult::Written:
                return FileOutcome::Upserted;
            case CatalogStore::UpsertResult::SkippedMissing:
                return FileOutcome::SkippedMissing;
            case CatalogStore::UpsertResult::Failed:
                break;
        }

        qWarning().noquote() << "Could not record" << path << ":" << err;
        return FileOutcome::SkippedStorageError;
    }

    void walkAndUpsert(const CatalogStore& store,
                       const QString& root,
                       ProgressTracker& tracker,
                       BatchSummary& summary) {
        QDirIterator it(root, kWalkFilters, QDirIterator::Subdirectories);
        while (it.hasNext()) {
            const QString path = it.next();
            summary.record(upsertOne(store, path));
            tracker.advance();
        }
    }

    QStringList uniqueRoots(const QStringList& roots) {
        QStringList out;
        QSet<QString> seen;
        for (const QString& r : roots) {
            const QString normalized = Utils::normalizePath(r);
            if (normalized.isEmpty() || seen.contains(normalized)) continue;
            seen.insert(normalized);
            out << normalized;
        }
        return out;
    }
}
