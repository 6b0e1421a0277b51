// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_SCANNERS_DIRECTORYWALKER_H
#define FINDEX_SCANNERS_DIRECTORYWALKER_H

#include "FsWalker.h"

namespace Scanners {
    /**
     * Walks a mounted directory tree through the regular filesystem API. Works for
     * any filesystem and needs no privileges beyond read access to the tree.
     *
     * Symlinks are recorded but never followed. Unreadable directories are skipped.
     */
    class DirectoryWalker final : public FsWalker {
    public:
        explicit DirectoryWalker(WalkOptions options = {});

        bool walk(const IndexEngine::DriveInfo& drive, const EntrySink& sink, QString* errorOut) override;

        [[nodiscard]] quint64 skippedCount() const { return m_skipped; }

    private:
        WalkOptions m_options;
        quint64 m_skipped = 0;
    };
}

#endif //FINDEX_SCANNERS_DIRECTORYWALKER_H
