// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef TAGDECK_SCANNERMANAGER_H
#define TAGDECK_SCANNERMANAGER_H

#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include "CatalogStore.h"
#include "ScannerEngine.h"

class QThread;

/**
 * @brief Keeps the catalog in sync with the directories it indexes.
 *
 * At most one walk runs at a time, on its own worker thread. The manager lives on the
 * foreground thread: only reconcile()/reconcileAll() move it to Scanning, and only the
 * completion handler, delivered back to this thread, returns it to Idle. Every signal is
 * emitted on the foreground thread, in order.
 */
class ScannerManager : public QObject {
    Q_OBJECT
public:
    enum class State { Idle, Scanning };

    enum class StartResult {
        Started,   // a walk is running; scannerFinished() follows
        UpToDate,  // fingerprints matched, nothing was touched; scannerFinished() already emitted
        Busy,      // rejected, another walk is running
        Failed     // the catalog could not be read; errorMessage() was emitted
    };

    explicit ScannerManager(CatalogStore store, QObject *parent = nullptr);
    ~ScannerManager() override;

    /**
     * @brief Brings the catalog rows under `root` in line with the disk.
     *
     * Compares the on-disk fingerprint with the catalog's; if the counts match and the catalog
     * is not older, returns UpToDate without walking. Otherwise registers the root, walks it in
     * the background upserting every file, then prunes rows whose file is gone.
     * The fingerprint itself is taken synchronously on the calling thread.
     * Fails for a path that is not a folder, and for a missing folder with no catalog rows under it.
     */
    StartResult reconcile(const QString &root);

    /**
     * @brief Walks every root in one pass with a combined total.
     * Never short-circuits. With no roots given, uses the registered ones.
     */
    StartResult reconcileAll(const QStringList &roots = {});

    [[nodiscard]] State state() const { return m_state; }
    [[nodiscard]] bool isRunning() const { return m_state == State::Scanning; }
    [[nodiscard]] const QString &currentPurpose() const { return m_purpose; }

    void setAllRootsProgressInterval(quint64 files) { m_allRootsInterval = files > 0 ? files : 1; }

signals:
    void progressMessage(const QString &message);
    void progressValue(quint64 processed, quint64 total);
    void errorMessage(const QString &title, const QString &message);
    void scannerStarted(quint64 total, const QString &purpose);
    void scannerFinished(const ScannerEngine::BatchSummary &summary);

private:
    bool rejectIfBusy();
    void startWorker(const QStringList &roots, quint64 total, quint64 step, const QString &purpose);
    void finishScan(const ScannerEngine::BatchSummary &summary);

    CatalogStore m_store;
    State m_state = State::Idle;
    QString m_purpose;
    quint64 m_allRootsInterval = ScannerEngine::kAllRootsProgressInterval;
    QPointer<QThread> m_worker;
};

#endif //TAGDECK_SCANNERMANAGER_H
