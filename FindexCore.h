// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_FINDEXCORE_H
#define FINDEX_FINDEXCORE_H

#include <memory>
#include <optional>
#include <vector>

#include <QFuture>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QThreadPool>

#include "DriveRegistry.h"
#include "EngineConfig.h"
#include "IndexLifecycleManager.h"
#include "SearchCoordinator.h"

/**
 * The engine as seen from the outside: owns the thread pools, the drive
 * registry, the lifecycle manager and the search coordinator, and forwards the
 * lifecycle events as its own signals.
 *
 * Builds and deltas run on one pool, searches on another, so a long rebuild
 * never starves interactive searches.
 */
class FindexCore final : public QObject {
    Q_OBJECT

public:
    explicit FindexCore(IndexEngine::EngineConfig config, Scanners::WalkerFactory walkerFactory = {},
                        QObject* parent = nullptr);
    ~FindexCore() override;

    /**
     * Walker used when none is injected: the raw ext4 walker for ext4 drives with a
     * device node (if enabled in the config), the directory walker otherwise.
     */
    [[nodiscard]] static Scanners::WalkerFactory defaultWalkerFactory(const IndexEngine::EngineConfig& config);

    bool addDrive(const IndexEngine::DriveInfo& drive, QString* errorOut = nullptr);
    [[nodiscard]] QStringList driveIds() const { return m_registry.driveIds(); }
    [[nodiscard]] std::optional<IndexEngine::DriveEntry> drive(const QString& driveId) const {
        return m_registry.entry(driveId);
    }

    /**
     * Compiles the query and searches the scope. Reusing a session key cancels
     * the previous search made with it.
     */
    [[nodiscard]] IndexEngine::SearchStream compileAndSearch(const QString& rawQuery,
                                                             const IndexEngine::DriveScope& scope = IndexEngine::DriveScope::all(),
                                                             const QString& sessionKey = {});

    bool cancelSearch(const QString& sessionKey);

    QFuture<IndexEngine::BuildSummary> buildIndex(const IndexEngine::DriveScope& scope = IndexEngine::DriveScope::all());
    QFuture<IndexEngine::BuildOutcome> buildDrive(const QString& driveId);

    [[nodiscard]] IndexEngine::IndexStatusReport checkIndexStatus(
        const IndexEngine::DriveScope& scope = IndexEngine::DriveScope::all()) const;

    QFuture<IndexEngine::DeltaResult> applyFsDelta(const QString& driveId, std::vector<IndexEngine::RawEntry> added,
                                                   std::vector<quint32> removedIds);
    QFuture<IndexEngine::DeltaResult> applyFsPathDelta(const QString& driveId, std::vector<IndexEngine::RawEntry> added,
                                                       QStringList removedPaths);

    int restoreSnapshots() { return m_lifecycle->restoreSnapshots(); }

    // Waits for every queued build and delta. Searches are not waited for.
    void waitForBuilds() { m_lifecycle->waitForIdle(); }

    [[nodiscard]] const IndexEngine::EngineConfig& config() const { return m_config; }
    [[nodiscard]] IndexEngine::SearchCoordinator& coordinator() { return *m_coordinator; }

signals:
    void driveIndexBuilding(const QString& driveId);
    void driveIndexReady(const QString& driveId, quint64 recordCount, quint64 generationId);
    void driveIndexFailed(const QString& driveId, const QString& reason);
    void indexRebuildFinished(const QStringList& built, const QStringList& failed);

private:
    IndexEngine::EngineConfig m_config;

    // Declared first so they outlive everything that queues work on them
    QThreadPool m_buildPool;
    QThreadPool m_searchPool;

    IndexEngine::DriveRegistry m_registry;
    std::unique_ptr<IndexEngine::IndexLifecycleManager> m_lifecycle;
    std::unique_ptr<IndexEngine::SearchCoordinator> m_coordinator;
};

#endif //FINDEX_FINDEXCORE_H
