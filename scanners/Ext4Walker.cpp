// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <iterator>
#include <string>
#include <unordered_map>
#include <vector>

#include <utf8.h>

#include "../Logging.h"
#include "Ext4Walker.h"

namespace Scanners {
    namespace {
        struct InodeName {
            ext2_ino_t parent = 0;
            std::string name;
        };

        struct InodeStats {
            uint64_t size = 0;
            int64_t mtime = 0;
            bool isDir = false;
            bool readOnly = false;
        };

        // Helper struct to pass the scan state to dirCallback
        struct ScanContext {
            std::unordered_map<ext2_ino_t, InodeName>& names;
            ext2_ino_t maxInodes;
        };

        // A resolved directory: its full path, or "skipped" if it or an ancestor is excluded
        struct DirPath {
            std::string path;
            bool skipped = false;
        };

        std::string repairUtf8(const char* data, size_t len) {
            std::string out(data, len);
            if (!utf8::is_valid(out.begin(), out.end())) {
                std::string fixed;
                utf8::replace_invalid(out.begin(), out.end(), std::back_inserter(fixed));
                return fixed;
            }
            return out;
        }
    }

    Ext4Walker::Ext4Walker(WalkOptions options)
        : m_options(std::move(options)) {
    }

    int Ext4Walker::dirCallback(ext2_ino_t dirIno, int /*entryFlags*/, ext2_dir_entry* dirent,
                                int /*offset*/, int /*blocksize*/, char* /*buf*/, void* privData) {
        if (dirent->inode == 0) {
            return 0;
        }

        // name_len carries the file type in its high byte on modern ext4
        const uint16_t len = dirent->name_len & 0xFF;
        if (len == 0) {
            return 0;
        }
        if (len == 1 && dirent->name[0] == '.') {
            return 0;
        }
        if (len == 2 && dirent->name[0] == '.' && dirent->name[1] == '.') {
            return 0;
        }

        auto* ctx = static_cast<ScanContext*>(privData);
        if (dirent->inode > ctx->maxInodes) {
            return 0;
        }

        // Hard links: keep the first name only
        ctx->names.try_emplace(dirent->inode, InodeName{dirIno, repairUtf8(dirent->name, len)});
        return 0;
    }

    bool Ext4Walker::walk(const IndexEngine::DriveInfo& drive, const EntrySink& sink, QString* errorOut) {
        if (drive.devNode.isEmpty()) {
            if (errorOut) *errorOut = QStringLiteral("No device node for drive %1").arg(drive.id);
            return false;
        }

        const std::string devicePath = drive.devNode.toStdString();

        ext2_filsys fs = nullptr;
        errcode_t retval = ext2fs_open(devicePath.c_str(), 0, 0, 0, unix_io_manager, &fs);
        if (retval) {
            if (errorOut) *errorOut = QStringLiteral("ext2fs_open(%1): %2")
                                          .arg(drive.devNode, QString::fromUtf8(error_message(retval)));
            return false;
        }

        const ext2_ino_t maxInodes = fs->super->s_inodes_count;

        std::unordered_map<ext2_ino_t, InodeName> names;
        std::unordered_map<ext2_ino_t, InodeStats> stats;
        names.reserve(1'500'000);
        stats.reserve(1'500'000);

        ext2_inode_scan scan = nullptr;
        retval = ext2fs_open_inode_scan(fs, 4096, &scan);
        if (retval) {
            if (errorOut) *errorOut = QStringLiteral("ext2fs_open_inode_scan: %1")
                                          .arg(QString::fromUtf8(error_message(retval)));
            ext2fs_close(fs);
            return false;
        }

        ScanContext ctx{names, maxInodes};

        ext2_ino_t ino = 0;
        ext2_inode inode{};
        while (true) {
            retval = ext2fs_get_next_inode(scan, &ino, &inode);
            if (retval) {
                if (errorOut) *errorOut = QStringLiteral("ext2fs_get_next_inode(%1): %2")
                                              .arg(drive.devNode, QString::fromUtf8(error_message(retval)));
                ext2fs_close_inode_scan(scan);
                ext2fs_close(fs);
                return false;
            }
            if (ino == 0) break;

            if (inode.i_links_count == 0) continue;

            InodeStats st;
            st.isDir = LINUX_S_ISDIR(inode.i_mode);
            st.size = st.isDir ? 0 : EXT2_I_SIZE(&inode);
            st.mtime = static_cast<int64_t>(inode.i_mtime);
            st.readOnly = (inode.i_mode & 0200) == 0;
            stats[ino] = st;

            if (st.isDir) {
                retval = ext2fs_dir_iterate2(fs, ino, 0, nullptr, &Ext4Walker::dirCallback, &ctx);
                if (retval) {
                    qCWarning(lcScan) << "Cannot list directory inode" << ino << error_message(retval);
                }
            }
        }

        ext2fs_close_inode_scan(scan);
        ext2fs_close(fs);

        qCInfo(lcScan) << "ext4 scan of" << drive.devNode << "found" << names.size() << "names";

        std::string root = drive.rootPath.toStdString();
        while (!root.empty() && root.back() == '/') root.pop_back();

        std::unordered_map<ext2_ino_t, DirPath> dirPaths;
        dirPaths[EXT2_ROOT_INO] = DirPath{root, false};

        auto isExcluded = [&](const std::string& name, bool isDir) {
            const bool hidden = !name.empty() && name.front() == '.';
            if (hidden && m_options.skipHidden) return true;
            return isDir && isSkippedDirName(m_options, QString::fromStdString(name));
        };

        // Resolve a directory inode to its path, walking up until a cached ancestor.
        auto resolveDir = [&](ext2_ino_t dirIno) -> const DirPath* {
            std::vector<ext2_ino_t> chain;
            ext2_ino_t current = dirIno;
            while (!dirPaths.contains(current)) {
                const auto it = names.find(current);
                if (it == names.end() || chain.size() > 4096) {
                    return nullptr; // orphan or loop
                }
                chain.push_back(current);
                current = it->second.parent;
            }

            DirPath base = dirPaths[current];
            for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
                const InodeName& n = names[*it];
                if (!base.skipped && isExcluded(n.name, true)) base.skipped = true;
                base.path += "/" + n.name;
                dirPaths[*it] = base;
            }
            return &dirPaths[dirIno];
        };

        for (const auto& [childIno, link] : names) {
            const auto statIt = stats.find(childIno);
            if (statIt == stats.end()) continue;
            const InodeStats& st = statIt->second;

            const DirPath* parent = resolveDir(link.parent);
            if (!parent || parent->skipped) continue;
            if (isExcluded(link.name, st.isDir)) continue;

            IndexEngine::RawEntry entry;
            entry.name = link.name;
            entry.fullPath = parent->path + "/" + link.name;
            entry.size = st.size;
            entry.mtime = st.mtime;
            entry.isDir = st.isDir;
            if (!link.name.empty() && link.name.front() == '.') entry.attributes |= IndexEngine::AttrHidden;
            if (st.readOnly) entry.attributes |= IndexEngine::AttrReadOnly;

            if (!sink(std::move(entry))) {
                if (errorOut) *errorOut = QStringLiteral("Walk aborted.");
                return false;
            }
        }

        return true;
    }
}
