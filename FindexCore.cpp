// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>

#include <QThread>

#include "DriveCatalog.h"
#include "FindexCore.h"
#include "Logging.h"
#include "scanners/DirectoryWalker.h"
#include "scanners/Ext4Walker.h"

using namespace IndexEngine;

FindexCore::FindexCore(EngineConfig config, Scanners::WalkerFactory walkerFactory, QObject* parent)
    : QObject(parent)
    , m_config(std::move(config)) {
    m_buildPool.setMaxThreadCount(std::max(m_config.buildThreads, 1));
    m_searchPool.setMaxThreadCount(m_config.searchThreads > 0 ? m_config.searchThreads
                                                              : std::max(QThread::idealThreadCount(), 2));

    if (!walkerFactory) {
        walkerFactory = defaultWalkerFactory(m_config);
    }

    m_lifecycle = std::make_unique<IndexLifecycleManager>(m_registry, &m_buildPool, std::move(walkerFactory));
    if (!m_config.snapshotDir.isEmpty()) {
        m_lifecycle->setSnapshotStore(std::make_unique<SnapshotStore>(m_config.snapshotDir));
    }

    SearchSettings search;
    search.batchSize = m_config.batchSize;
    search.maxResultsPerDrive = m_config.maxResultsPerDrive;
    search.channelCapacity = m_config.channelCapacity;
    search.matchScope = m_config.matchPath ? MatchScope::NameOrPath : MatchScope::NameOnly;
    search.queryCacheSize = m_config.queryCacheSize;
    m_coordinator = std::make_unique<SearchCoordinator>(m_registry, &m_searchPool, search);

    connect(m_lifecycle.get(), &IndexLifecycleManager::driveIndexBuilding, this, &FindexCore::driveIndexBuilding);
    connect(m_lifecycle.get(), &IndexLifecycleManager::driveIndexReady, this, &FindexCore::driveIndexReady);
    connect(m_lifecycle.get(), &IndexLifecycleManager::driveIndexFailed, this, &FindexCore::driveIndexFailed);
    connect(m_lifecycle.get(), &IndexLifecycleManager::indexRebuildFinished, this, &FindexCore::indexRebuildFinished);

    for (const DriveInfo& d : m_config.roots) {
        QString err;
        if (!addDrive(d, &err)) {
            qCWarning(lcIndex) << "Ignoring configured root" << d.rootPath << ":" << err;
        }
    }

    if (m_config.discoverMounts) {
        for (const DriveInfo& d : DriveCatalog::mountedDrives()) {
            QString err;
            if (!addDrive(d, &err)) {
                qCDebug(lcIndex) << "Skipping discovered drive" << d.id << ":" << err;
            }
        }
    }
}

FindexCore::~FindexCore() {
    // Cancel and drain searches before builds; both before the pools go away
    m_coordinator.reset();
    m_lifecycle.reset();
}

Scanners::WalkerFactory FindexCore::defaultWalkerFactory(const EngineConfig& config) {
    const Scanners::WalkOptions options = config.walk;
    const bool rawExt4 = config.rawExt4Scan;

    return [options, rawExt4](const DriveInfo& drive) -> std::unique_ptr<Scanners::FsWalker> {
        if (rawExt4 && drive.fsType == QStringLiteral("ext4") && !drive.devNode.isEmpty()) {
            return std::make_unique<Scanners::Ext4Walker>(options);
        }
        return std::make_unique<Scanners::DirectoryWalker>(options);
    };
}

bool FindexCore::addDrive(const DriveInfo& drive, QString* errorOut) {
    if (!m_registry.addDrive(drive, errorOut)) {
        return false;
    }
    qCInfo(lcIndex) << "Registered drive" << drive.id << "at" << drive.rootPath;
    return true;
}

SearchStream FindexCore::compileAndSearch(const QString& rawQuery, const DriveScope& scope, const QString& sessionKey) {
    return m_coordinator->compileAndSearch(rawQuery, scope, sessionKey);
}

bool FindexCore::cancelSearch(const QString& sessionKey) {
    return m_coordinator->cancelSession(sessionKey);
}

QFuture<BuildSummary> FindexCore::buildIndex(const DriveScope& scope) {
    return m_lifecycle->buildIndex(scope);
}

QFuture<BuildOutcome> FindexCore::buildDrive(const QString& driveId) {
    return m_lifecycle->buildOrRebuild(driveId);
}

IndexStatusReport FindexCore::checkIndexStatus(const DriveScope& scope) const {
    return m_lifecycle->checkIndexStatus(scope);
}

QFuture<DeltaResult> FindexCore::applyFsDelta(const QString& driveId, std::vector<RawEntry> added,
                                              std::vector<quint32> removedIds) {
    return m_lifecycle->applyDelta(driveId, std::move(added), std::move(removedIds));
}

QFuture<DeltaResult> FindexCore::applyFsPathDelta(const QString& driveId, std::vector<RawEntry> added,
                                                  QStringList removedPaths) {
    return m_lifecycle->applyPathDelta(driveId, std::move(added), std::move(removedPaths));
}
