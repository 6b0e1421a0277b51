// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_ENGINECONFIG_H
#define FINDEX_ENGINECONFIG_H

#include <vector>

#include <QSettings>
#include <QString>

#include "IndexEngine.h"
#include "scanners/FsWalker.h"

namespace IndexEngine {
    struct EngineConfig {
        // search/*
        int batchSize = 200;
        int maxResultsPerDrive = 1000;
        int channelCapacity = 8;
        bool matchPath = true;
        int queryCacheSize = 64;

        // index/*
        int buildThreads = 2;
        int searchThreads = 0; // 0 = QThread::idealThreadCount()
        QString snapshotDir;   // empty = no snapshots
        Scanners::WalkOptions walk;
        bool rawExt4Scan = false;
        bool discoverMounts = false;

        // drives/roots
        std::vector<DriveInfo> roots;
    };

    /**
     * Reads the configuration from QSettings. Missing keys keep their defaults;
     * out-of-range values are replaced by the default with a warning.
     */
    [[nodiscard]] EngineConfig loadConfig(QSettings& settings);

    /**
     * Turns "id=/path" or "/path" into a drive. The id defaults to "path:/path".
     */
    [[nodiscard]] DriveInfo driveFromRootSpec(const QString& spec);
}

#endif //FINDEX_ENGINECONFIG_H
