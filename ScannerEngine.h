// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef TAGDECK_SCANNERENGINE_H
#define TAGDECK_SCANNERENGINE_H

#include <QString>
#include <QStringList>
#include <functional>

class CatalogStore;

/**
 * Filesystem side of reconciliation: walking a directory tree, fingerprinting it and
 * pushing what it finds into a CatalogStore. Everything here runs synchronously on the
 * calling thread; ScannerManager decides which thread that is.
 */
namespace ScannerEngine {
    // Progress granularity of reconcileAll(), in files.
    inline constexpr quint64 kAllRootsProgressInterval = 500;

    enum class FileOutcome {
        Upserted,
        SkippedMissing,      // vanished or stopped being a regular file mid-walk
        SkippedStorageError  // the store rejected the write
    };

    // (file count, newest mtime) of a tree on disk.
    struct DiskFingerprint {
        quint64 count = 0;
        double maxMtime = 0.0;
    };

    struct BatchSummary {
        quint64 processed = 0;
        quint64 upserted = 0;
        quint64 skippedMissing = 0;
        quint64 skippedErrors = 0;
        quint64 removed = 0;
        quint64 total = 0;
        bool upToDate = false;
        QStringList roots;

        void record(FileOutcome outcome);
    };

    using ProgressCallback = std::function<void(quint64 processed, quint64 total)>;

    /**
     * Reports progress every `step` files and always ends on (total, total),
     * even when fewer or more files were walked than counted up front.
     * Reported values are strictly increasing and never exceed total.
     */
    class ProgressTracker {
    public:
        ProgressTracker(quint64 total, quint64 step, ProgressCallback callback);

        void advance();
        void finish();

        [[nodiscard]] quint64 total() const { return m_total; }
        [[nodiscard]] quint64 processed() const { return m_processed; }

    private:
        void report(quint64 value);

        quint64 m_total;
        quint64 m_step;
        quint64 m_processed = 0;
        quint64 m_lastReported = 0;
        ProgressCallback m_callback;
    };

    /**
     * Counts the regular files below `root` and finds their newest modification time.
     * Hidden files are included, symlinked directories are not followed. Entries that
     * cannot be stat'ed are left out of both numbers.
     */
    [[nodiscard]] DiskFingerprint fingerprintDirectory(const QString& root);

    // max(1, total / 100): roughly one event per percent.
    [[nodiscard]] quint64 progressStep(quint64 total);

    // Upserts one file and classifies what happened.
    FileOutcome upsertOne(const CatalogStore& store, const QString& path);

    /**
     * Walks `root` and upserts every regular file into the store, recording each outcome
     * in `summary` and advancing `tracker` once per file. Per-file failures never stop the walk.
     */
    void walkAndUpsert(const CatalogStore& store,
                       const QString& root,
                       ProgressTracker& tracker,
                       BatchSummary& summary);

    /**
     * Normalizes every root and drops duplicates and empty entries, keeping first-seen order.
     */
    [[nodiscard]] QStringList uniqueRoots(const QStringList& roots);
}

#endif //TAGDECK_SCANNERENGINE_H
