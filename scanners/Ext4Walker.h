// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_SCANNERS_EXT4WALKER_H
#define FINDEX_SCANNERS_EXT4WALKER_H

#include <ext2fs/ext2fs.h>

#include "FsWalker.h"

namespace Scanners {
    /**
     * Reads an ext2/3/4 filesystem straight from its block device with libext2fs,
     * without going through the mounted tree. Much faster than a directory walk on
     * large volumes, but needs read access to the device node (usually root).
     *
     * Full paths are built below DriveInfo::rootPath, which should be the mount
     * point of DriveInfo::devNode.
     */
    class Ext4Walker final : public FsWalker {
    public:
        explicit Ext4Walker(WalkOptions options = {});

        bool walk(const IndexEngine::DriveInfo& drive, const EntrySink& sink, QString* errorOut) override;

        /**
         * Callback for ext2fs_dir_iterate2(). Records the first name seen for every
         * inode together with the inode of the directory holding it.
         */
        static int dirCallback(ext2_ino_t dirIno, int entryFlags, ext2_dir_entry* dirent,
                               int offset, int blocksize, char* buf, void* privData);

    private:
        WalkOptions m_options;
    };
}

#endif //FINDEX_SCANNERS_EXT4WALKER_H
