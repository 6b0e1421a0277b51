// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_SCANNERS_FSWALKER_H
#define FINDEX_SCANNERS_FSWALKER_H

#include <functional>
#include <memory>

#include <QString>
#include <QStringList>

#include "../IndexEngine.h"

namespace Scanners {
    /**
     * Receives every entry found by a walk. Returning false stops the walk.
     */
    using EntrySink = std::function<bool(IndexEngine::RawEntry&& entry)>;

    struct WalkOptions {
        // Directory names (lowercase) that are neither recorded nor descended into
        QStringList skipDirNames = {
            QStringLiteral("$recycle.bin"),
            QStringLiteral("system volume information"),
            QStringLiteral(".git"),
            QStringLiteral("node_modules"),
            QStringLiteral("__pycache__"),
        };
        bool skipHidden = false;
        bool stayOnFilesystem = true;
    };

    /**
     * Produces the entries of one drive. Implementations must not emit the root
     * directory itself.
     */
    class FsWalker {
    public:
        virtual ~FsWalker() = default;

        /**
         * @param drive The drive to walk; rootPath is where full paths start.
         * @param sink Called once per entry, in walk order.
         * @param errorOut Receives the reason when the walk fails.
         * @return false if the walk could not be completed.
         */
        virtual bool walk(const IndexEngine::DriveInfo& drive, const EntrySink& sink, QString* errorOut) = 0;
    };

    using WalkerFactory = std::function<std::unique_ptr<FsWalker>(const IndexEngine::DriveInfo& drive)>;

    [[nodiscard]] inline bool isSkippedDirName(const WalkOptions& options, const QString& name) {
        return options.skipDirNames.contains(name.toLower());
    }
}

#endif //FINDEX_SCANNERS_FSWALKER_H
