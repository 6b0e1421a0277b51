// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QDir>

#include "EngineConfig.h"
#include "Logging.h"

namespace IndexEngine {
    static int readInt(QSettings& settings, const QString& key, int def, int min, int max) {
        if (!settings.contains(key)) return def;

        bool ok = false;
        const int v = settings.value(key).toInt(&ok);
        if (!ok || v < min || v > max) {
            qCWarning(lcService) << "Invalid value for" << key << settings.value(key)
                                 << "- using default" << def;
            return def;
        }
        return v;
    }

    static bool readBool(QSettings& settings, const QString& key, bool def) {
        if (!settings.contains(key)) return def;
        return settings.value(key).toBool();
    }

    DriveInfo driveFromRootSpec(const QString& spec) {
        DriveInfo d;
        const qsizetype eq = spec.indexOf(QLatin1Char('='));
        if (eq > 0) {
            d.id = spec.left(eq).trimmed();
            d.rootPath = QDir::cleanPath(spec.mid(eq + 1).trimmed());
        } else {
            d.rootPath = QDir::cleanPath(spec.trimmed());
            d.id = QStringLiteral("path:") + d.rootPath;
        }
        return d;
    }

    EngineConfig loadConfig(QSettings& settings) {
        EngineConfig c;

        c.batchSize          = readInt(settings, QStringLiteral("search/batchSize"), c.batchSize, 1, 100'000);
        c.maxResultsPerDrive = readInt(settings, QStringLiteral("search/maxResultsPerDrive"), c.maxResultsPerDrive, 1, 10'000'000);
        c.channelCapacity    = readInt(settings, QStringLiteral("search/channelCapacity"), c.channelCapacity, 1, 4096);
        c.matchPath          = readBool(settings, QStringLiteral("search/matchPath"), c.matchPath);
        c.queryCacheSize     = readInt(settings, QStringLiteral("search/queryCacheSize"), c.queryCacheSize, 0, 100'000);

        c.buildThreads  = readInt(settings, QStringLiteral("index/buildThreads"), c.buildThreads, 1, 256);
        c.searchThreads = readInt(settings, QStringLiteral("index/searchThreads"), c.searchThreads, 0, 256);
        c.snapshotDir   = settings.value(QStringLiteral("index/snapshotDir"), c.snapshotDir).toString();

        if (settings.contains(QStringLiteral("index/skipDirs"))) {
            QStringList dirs;
            for (const QString& d : settings.value(QStringLiteral("index/skipDirs")).toStringList()) {
                const QString t = d.trimmed().toLower();
                if (!t.isEmpty()) dirs.push_back(t);
            }
            c.walk.skipDirNames = dirs;
        }
        c.walk.skipHidden       = readBool(settings, QStringLiteral("index/skipHidden"), c.walk.skipHidden);
        c.walk.stayOnFilesystem = readBool(settings, QStringLiteral("index/stayOnFilesystem"), c.walk.stayOnFilesystem);
        c.rawExt4Scan           = readBool(settings, QStringLiteral("index/rawExt4Scan"), c.rawExt4Scan);
        c.discoverMounts        = readBool(settings, QStringLiteral("index/discoverMounts"), c.discoverMounts);

        for (const QString& spec : settings.value(QStringLiteral("drives/roots")).toStringList()) {
            if (spec.trimmed().isEmpty()) continue;
            c.roots.push_back(driveFromRootSpec(spec));
        }

        return c;
    }
}
