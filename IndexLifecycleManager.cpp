// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QDateTime>
#include <QElapsedTimer>
#include <QMutexLocker>

#include "IndexLifecycleManager.h"
#include "Logging.h"
#include "Utils.h"

namespace IndexEngine {
    namespace {
        template <typename T>
        QFuture<T> finishedFuture(T value) {
            QPromise<T> promise;
            QFuture<T> future = promise.future();
            promise.start();
            promise.addResult(std::move(value));
            promise.finish();
            return future;
        }

        template <typename T, typename Fn>
        QFuture<T> runOnPool(QThreadPool* pool, Fn fn) {
            auto promise = std::make_shared<QPromise<T>>();
            QFuture<T> future = promise->future();
            promise->start();

            pool->start([promise, fn = std::move(fn)]() mutable {
                promise->addResult(fn());
                promise->finish();
            });
            return future;
        }
    }

    BuildTicket::BuildTicket() {
        m_future = m_promise.future();
        m_promise.start();
    }

    void BuildTicket::onFinished(std::function<void(const BuildOutcome&)> hook) {
        QMutexLocker lock(&m_mutex);
        if (m_outcome) {
            const BuildOutcome outcome = *m_outcome;
            lock.unlock();
            hook(outcome);
            return;
        }
        m_hooks.push_back(std::move(hook));
    }

    void BuildTicket::finish(const BuildOutcome& outcome) {
        std::vector<std::function<void(const BuildOutcome&)>> hooks;
        {
            QMutexLocker lock(&m_mutex);
            if (m_outcome) return;

            m_outcome = outcome;
            hooks.swap(m_hooks);
            m_promise.addResult(outcome);
            m_promise.finish();
        }

        for (const auto& hook : hooks) {
            hook(outcome);
        }
    }

    IndexLifecycleManager::IndexLifecycleManager(DriveRegistry& registry, QThreadPool* pool,
                                                 Scanners::WalkerFactory walkerFactory, QObject* parent)
        : QObject(parent)
        , m_registry(registry)
        , m_pool(pool)
        , m_walkerFactory(std::move(walkerFactory)) {
    }

    IndexLifecycleManager::~IndexLifecycleManager() {
        // Queued builds capture 'this'
        m_pool->waitForDone();
    }

    void IndexLifecycleManager::setSnapshotStore(std::unique_ptr<SnapshotStore> store) {
        m_snapshots = std::move(store);
    }

    std::optional<IndexState> IndexLifecycleManager::status(const QString& driveId) const {
        return m_registry.state(driveId);
    }

    std::shared_ptr<QMutex> IndexLifecycleManager::writeMutexFor(const QString& driveId) {
        QMutexLocker lock(&m_mutex);
        auto& slot = m_writeMutexes[driveId];
        if (!slot) slot = std::make_shared<QMutex>();
        return slot;
    }

    std::shared_ptr<BuildTicket> IndexLifecycleManager::startBuild(const QString& driveId) {
        QMutexLocker lock(&m_mutex);

        if (const auto it = m_inFlight.find(driveId); it != m_inFlight.end()) {
            qCDebug(lcIndex) << "Joining build already running for" << driveId;
            return it->second;
        }

        auto ticket = std::make_shared<BuildTicket>();

        QString err;
        if (!m_registry.beginBuild(driveId, &err)) {
            lock.unlock();
            qCWarning(lcIndex) << "Cannot build" << driveId << ":" << err;

            BuildOutcome outcome;
            outcome.driveId = driveId;
            outcome.error = err;
            ticket->finish(outcome);
            return ticket;
        }

        m_inFlight.emplace(driveId, ticket);
        lock.unlock();

        emit driveIndexBuilding(driveId);

        m_pool->start([this, driveId, ticket]() {
            const BuildOutcome outcome = runBuild(driveId);
            {
                QMutexLocker l(&m_mutex);
                m_inFlight.erase(driveId);
            }
            ticket->finish(outcome);
        });

        return ticket;
    }

    QFuture<BuildOutcome> IndexLifecycleManager::buildOrRebuild(const QString& driveId) {
        return startBuild(driveId)->future();
    }

    BuildOutcome IndexLifecycleManager::runBuild(const QString& driveId) {
        BuildOutcome outcome;
        outcome.driveId = driveId;

        QElapsedTimer timer;
        timer.start();

        const std::optional<DriveEntry> entry = m_registry.entry(driveId);
        std::unique_ptr<Scanners::FsWalker> walker;
        if (entry && m_walkerFactory) {
            walker = m_walkerFactory(entry->info);
        }

        auto store = std::make_shared<DriveStore>();
        QString err;
        bool ok = false;

        if (!entry) {
            err = QStringLiteral("Unknown drive: %1").arg(driveId);
        } else if (!walker) {
            err = QStringLiteral("No walker available for drive %1").arg(driveId);
        } else {
            qCInfo(lcIndex) << "Indexing" << driveId << "at" << entry->info.rootPath;
            ok = walker->walk(entry->info,
                              [&store](RawEntry&& e) {
                                  store->append(std::move(e));
                                  return true;
                              },
                              &err);
        }

        outcome.elapsedMs = timer.elapsed();

        if (!ok) {
            if (err.isEmpty()) err = QStringLiteral("Walk failed.");
            outcome.error = err;

            QString transitionErr;
            if (!m_registry.failBuild(driveId, err, &transitionErr)) {
                qCCritical(lcIndex) << transitionErr;
            }
            qCWarning(lcIndex) << "Index build failed for" << driveId << ":" << err;
            emit driveIndexFailed(driveId, err);
            return outcome;
        }

        store->indexedAt = QDateTime::currentSecsSinceEpoch();

        {
            // Deltas clone-and-publish under the same lock
            const std::shared_ptr<QMutex> writeMutex = writeMutexFor(driveId);
            QMutexLocker writeLock(writeMutex.get());

            if (!m_registry.completeBuild(driveId, store, &outcome.generationId, &err)) {
                outcome.error = err;
                qCCritical(lcIndex) << "Cannot publish index for" << driveId << ":" << err;
                emit driveIndexFailed(driveId, err);
                return outcome;
            }
        }

        outcome.ok = true;
        outcome.recordCount = static_cast<quint64>(store->liveCount());

        qCInfo(lcIndex) << "Indexed" << driveId << ":" << outcome.recordCount << "records in"
                        << outcome.elapsedMs << "ms, generation" << outcome.generationId;

        if (m_snapshots) {
            QString snapErr;
            if (!m_snapshots->save(driveId, *store, &snapErr)) {
                qCWarning(lcIndex) << "Snapshot not saved for" << driveId << ":" << snapErr;
            }
        }

        emit driveIndexReady(driveId, outcome.recordCount, outcome.generationId);
        return outcome;
    }

    QFuture<BuildSummary> IndexLifecycleManager::buildIndex(const DriveScope& scope) {
        const QStringList ids = scope.allDrives ? m_registry.driveIds() : QStringList{scope.driveId};

        if (ids.isEmpty()) {
            emit indexRebuildFinished({}, {});
            return finishedFuture(BuildSummary{});
        }

        struct Pending {
            QMutex mutex;
            qsizetype remaining = 0;
            BuildSummary summary;
            QPromise<BuildSummary> promise;
        };

        auto pending = std::make_shared<Pending>();
        pending->remaining = ids.size();
        QFuture<BuildSummary> future = pending->promise.future();
        pending->promise.start();

        for (const QString& id : ids) {
            startBuild(id)->onFinished([this, pending](const BuildOutcome& o) {
                QMutexLocker lock(&pending->mutex);
                if (o.ok) {
                    pending->summary.built.push_back(o.driveId);
                } else {
                    pending->summary.failed.push_back(o.driveId);
                    pending->summary.errors.insert(o.driveId, o.error);
                }

                if (--pending->remaining > 0) return;

                pending->summary.built.sort();
                pending->summary.failed.sort();
                const BuildSummary summary = pending->summary;
                pending->promise.addResult(summary);
                pending->promise.finish();
                lock.unlock();

                emit indexRebuildFinished(summary.built, summary.failed);
            });
        }

        return future;
    }

    QFuture<DeltaResult> IndexLifecycleManager::applyDelta(const QString& driveId, std::vector<RawEntry> added,
                                                           std::vector<quint32> removedIds) {
        return runOnPool<DeltaResult>(m_pool, [this, driveId, added = std::move(added),
                                               removedIds = std::move(removedIds)]() mutable {
            return runDelta(driveId, std::move(added), removedIds, {});
        });
    }

    QFuture<DeltaResult> IndexLifecycleManager::applyPathDelta(const QString& driveId, std::vector<RawEntry> added,
                                                               QStringList removedPaths) {
        return runOnPool<DeltaResult>(m_pool, [this, driveId, added = std::move(added),
                                               removedPaths = std::move(removedPaths)]() mutable {
            return runDelta(driveId, std::move(added), {}, removedPaths);
        });
    }

    DeltaResult IndexLifecycleManager::runDelta(const QString& driveId, std::vector<RawEntry>&& added,
                                                const std::vector<quint32>& removedIds,
                                                const QStringList& removedPaths) {
        DeltaResult r;

        if (!m_registry.hasDrive(driveId)) {
            r.error = QStringLiteral("Unknown drive: %1").arg(driveId);
            return r;
        }

        const std::shared_ptr<QMutex> writeMutex = writeMutexFor(driveId);
        QMutexLocker writeLock(writeMutex.get());

        const Generation current = m_registry.generation(driveId);
        if (!current) {
            r.error = QStringLiteral("Drive %1 has no published index.").arg(driveId);
            qCWarning(lcIndex) << "Delta rejected:" << r.error;
            return r;
        }

        auto next = std::make_shared<DriveStore>(*current);

        for (const quint32 id : removedIds) {
            if (next->remove(id)) ++r.removed;
            else ++r.skipped;
        }
        for (const QString& path : removedPaths) {
            const std::optional<quint32> id = next->findByPath(path.toStdString());
            if (id && next->remove(*id)) ++r.removed;
            else ++r.skipped;
        }

        r.addedIds.reserve(added.size());
        for (RawEntry& e : added) {
            r.addedIds.push_back(next->append(std::move(e)));
            ++r.added;
        }

        if (!m_registry.replaceGeneration(driveId, next, &r.generationId, &r.error)) {
            qCWarning(lcIndex) << "Delta not published:" << r.error;
            return r;
        }

        r.ok = true;
        qCDebug(lcIndex) << "Delta on" << driveId << "+" << r.added << "-" << r.removed
                         << "skipped" << r.skipped << "generation" << r.generationId;

        emit driveIndexReady(driveId, static_cast<quint64>(next->liveCount()), r.generationId);
        return r;
    }

    IndexStatusReport IndexLifecycleManager::checkIndexStatus(const DriveScope& scope) const {
        IndexStatusReport report;

        auto add = [&report](const DriveEntry& e) {
            DriveStatus s;
            s.info = e.info;
            s.state = e.state;
            if (e.generation) {
                s.stats = e.generation->stats();
                s.indexedAt = e.generation->indexedAt;
                report.totalFiles += s.stats.liveRecords;
            }
            if (e.state.kind == IndexState::Kind::Ready) ++report.readyCount;
            report.drives.push_back(std::move(s));
        };

        if (scope.allDrives) {
            for (const DriveEntry& e : m_registry.entries()) add(e);
        } else if (const auto e = m_registry.entry(scope.driveId)) {
            add(*e);
        } else {
            report.unknownDrive = true;
        }

        report.totalDrives = static_cast<int>(report.drives.size());
        return report;
    }

    int IndexLifecycleManager::restoreSnapshots() {
        if (!m_snapshots) return 0;

        int restored = 0;
        for (const DriveEntry& e : m_registry.entries()) {
            if (e.state.kind != IndexState::Kind::NotBuilt) continue;

            const QString& id = e.info.id;
            QString err;
            std::optional<DriveStore> loaded = m_snapshots->load(id, &err);
            if (!loaded) {
                qCDebug(lcIndex) << "No usable snapshot for" << id << ":" << err;
                continue;
            }

            auto store = std::make_shared<DriveStore>(std::move(*loaded));
            quint64 gen = 0;
            {
                QMutexLocker lock(&m_mutex);
                if (m_inFlight.contains(id)) continue;

                if (!m_registry.beginBuild(id, &err) || !m_registry.completeBuild(id, store, &gen, &err)) {
                    qCWarning(lcIndex) << "Cannot publish snapshot of" << id << ":" << err;
                    continue;
                }
            }

            qCInfo(lcIndex) << "Restored" << id << "from snapshot taken"
                            << QString::fromStdString(Utils::secondsToFormattedTime(store->indexedAt))
                            << "(" << store->liveCount() << "records )";
            emit driveIndexReady(id, static_cast<quint64>(store->liveCount()), gen);
            ++restored;
        }
        return restored;
    }

    void IndexLifecycleManager::waitForIdle() {
        m_pool->waitForDone();
    }
}
