// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_INDEXLIFECYCLEMANAGER_H
#define FINDEX_INDEXLIFECYCLEMANAGER_H

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include <QFuture>
#include <QPromise>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QThreadPool>

#include "DriveRegistry.h"
#include "SnapshotStore.h"
#include "scanners/FsWalker.h"

namespace IndexEngine {
    struct BuildOutcome {
        QString driveId;
        bool ok = false;
        quint64 recordCount = 0;
        quint64 generationId = 0;
        qint64 elapsedMs = 0;
        QString error;
    };

    struct BuildSummary {
        QStringList built;
        QStringList failed;
        QMap<QString, QString> errors; // driveId -> reason
    };

    struct DeltaResult {
        bool ok = false;
        quint32 added = 0;
        quint32 removed = 0;
        quint32 skipped = 0; // removals naming unknown or already removed records
        quint64 generationId = 0;
        std::vector<quint32> addedIds;
        QString error;
    };

    struct DriveStatus {
        DriveInfo info;
        IndexState state;
        StoreStats stats;
        int64_t indexedAt = 0;
    };

    struct IndexStatusReport {
        std::vector<DriveStatus> drives;
        int readyCount = 0;
        int totalDrives = 0;
        quint64 totalFiles = 0;
        bool unknownDrive = false;
    };

    /**
     * Shared handle of one running build. Every request that coalesces onto the
     * build gets the same future; hooks run once the outcome is known (immediately
     * if it already is).
     */
    class BuildTicket {
    public:
        BuildTicket();

        [[nodiscard]] QFuture<BuildOutcome> future() const { return m_future; }

        void onFinished(std::function<void(const BuildOutcome&)> hook);
        void finish(const BuildOutcome& outcome);

    private:
        mutable QMutex m_mutex;
        QPromise<BuildOutcome> m_promise;
        QFuture<BuildOutcome> m_future;
        std::optional<BuildOutcome> m_outcome;
        std::vector<std::function<void(const BuildOutcome&)>> m_hooks;
    };

    /**
     * Drives the per-drive index lifecycle: builds and rebuilds, failure handling,
     * publication of new generations, incremental deltas and snapshot restore.
     *
     * Work runs on the given pool. At most one build per drive is in flight; a
     * request made while one is running gets the same future.
     */
    class IndexLifecycleManager final : public QObject {
        Q_OBJECT

    public:
        IndexLifecycleManager(DriveRegistry& registry, QThreadPool* pool,
                              Scanners::WalkerFactory walkerFactory, QObject* parent = nullptr);
        ~IndexLifecycleManager() override;

        // Optional; when set, every successful build is saved and restoreSnapshots() works.
        void setSnapshotStore(std::unique_ptr<SnapshotStore> store);
        [[nodiscard]] const SnapshotStore* snapshotStore() const { return m_snapshots.get(); }

        [[nodiscard]] std::optional<IndexState> status(const QString& driveId) const;

        /**
         * Starts a (re)build of one drive, or joins the one already running.
         *
         * @return A future that finishes once the drive is Ready or Failed.
         *         Unknown drives yield an already finished, failed outcome.
         */
        QFuture<BuildOutcome> buildOrRebuild(const QString& driveId);

        /**
         * Builds every drive in scope (concurrently, bounded by the pool).
         */
        QFuture<BuildSummary> buildIndex(const DriveScope& scope);

        /**
         * Applies additions and removals to a copy of the current generation and
         * publishes it. Deltas for one drive are applied one at a time.
         */
        QFuture<DeltaResult> applyDelta(const QString& driveId, std::vector<RawEntry> added,
                                        std::vector<quint32> removedIds);

        /**
         * Same as applyDelta(), with removals given as full paths.
         */
        QFuture<DeltaResult> applyPathDelta(const QString& driveId, std::vector<RawEntry> added,
                                            QStringList removedPaths);

        [[nodiscard]] IndexStatusReport checkIndexStatus(const DriveScope& scope) const;

        /**
         * Publishes the snapshot of every NotBuilt drive that has one.
         *
         * @return The number of drives restored.
         */
        int restoreSnapshots();

        // Blocks until all queued work on the pool is done. For shutdown and tests.
        void waitForIdle();

    signals:
        void driveIndexBuilding(const QString& driveId);
        void driveIndexReady(const QString& driveId, quint64 recordCount, quint64 generationId);
        void driveIndexFailed(const QString& driveId, const QString& reason);
        void indexRebuildFinished(const QStringList& built, const QStringList& failed);

    private:
        std::shared_ptr<BuildTicket> startBuild(const QString& driveId);
        BuildOutcome runBuild(const QString& driveId);
        DeltaResult runDelta(const QString& driveId, std::vector<RawEntry>&& added,
                             const std::vector<quint32>& removedIds, const QStringList& removedPaths);
        std::shared_ptr<QMutex> writeMutexFor(const QString& driveId);

        DriveRegistry& m_registry;
        QThreadPool* m_pool;
        Scanners::WalkerFactory m_walkerFactory;
        std::unique_ptr<SnapshotStore> m_snapshots;

        mutable QMutex m_mutex; // guards m_inFlight and m_writeMutexes
        std::map<QString, std::shared_ptr<BuildTicket>> m_inFlight;
        std::map<QString, std::shared_ptr<QMutex>> m_writeMutexes;
    };
}

#endif //FINDEX_INDEXLIFECYCLEMANAGER_H
