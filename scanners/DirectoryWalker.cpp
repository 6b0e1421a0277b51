// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <filesystem>
#include <system_error>

#include <sys/stat.h>

#include "../Logging.h"
#include "DirectoryWalker.h"

namespace fs = std::filesystem;

namespace Scanners {
    DirectoryWalker::DirectoryWalker(WalkOptions options)
        : m_options(std::move(options)) {
    }

    bool DirectoryWalker::walk(const IndexEngine::DriveInfo& drive, const EntrySink& sink, QString* errorOut) {
        m_skipped = 0;

        std::string root = drive.rootPath.toStdString();
        while (root.size() > 1 && root.back() == '/') root.pop_back();

        struct stat rootSt{};
        if (root.empty() || ::stat(root.c_str(), &rootSt) != 0 || !S_ISDIR(rootSt.st_mode)) {
            if (errorOut) *errorOut = QStringLiteral("Root is not a readable directory: %1").arg(drive.rootPath);
            return false;
        }

        std::error_code ec;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            if (errorOut) *errorOut = QStringLiteral("Cannot open %1: %2")
                                          .arg(drive.rootPath, QString::fromStdString(ec.message()));
            return false;
        }

        const fs::recursive_directory_iterator end;

        // The iterator is not usable after a failed increment, so the walk is incomplete.
        auto advance = [&](const std::string& current) -> bool {
            it.increment(ec);
            if (!ec) return true;

            qCWarning(lcScan) << "Walk failed after" << QString::fromStdString(current)
                              << QString::fromStdString(ec.message());
            if (errorOut) *errorOut = QStringLiteral("Walk of %1 failed after %2: %3")
                                          .arg(drive.rootPath, QString::fromStdString(current),
                                               QString::fromStdString(ec.message()));
            return false;
        };

        while (it != end) {
            const fs::directory_entry& de = *it;
            const std::string fullPath = de.path().string();
            std::string name = de.path().filename().string();

            struct stat st{};
            if (::lstat(fullPath.c_str(), &st) != 0) {
                // Vanished between listing and stat
                ++m_skipped;
                if (!advance(fullPath)) return false;
                continue;
            }

            const bool isDir = S_ISDIR(st.st_mode);
            const bool hidden = !name.empty() && name.front() == '.';

            bool skip = false;
            if (isDir && isSkippedDirName(m_options, QString::fromStdString(name))) skip = true;
            if (hidden && m_options.skipHidden) skip = true;

            if (skip) {
                ++m_skipped;
                if (isDir) it.disable_recursion_pending();
            } else {
                if (isDir && m_options.stayOnFilesystem && st.st_dev != rootSt.st_dev) {
                    // Record the mount point itself but not what is mounted on it
                    it.disable_recursion_pending();
                }

                IndexEngine::RawEntry entry;
                entry.name = std::move(name);
                entry.fullPath = fullPath;
                entry.size = isDir ? 0 : static_cast<uint64_t>(st.st_size);
                entry.mtime = static_cast<int64_t>(st.st_mtime);
                entry.isDir = isDir;
                if (hidden) entry.attributes |= IndexEngine::AttrHidden;
                if ((st.st_mode & S_IWUSR) == 0) entry.attributes |= IndexEngine::AttrReadOnly;

                if (!sink(std::move(entry))) {
                    if (errorOut) *errorOut = QStringLiteral("Walk aborted.");
                    return false;
                }
            }

            if (!advance(fullPath)) return false;
        }

        if (m_skipped > 0) {
            qCDebug(lcScan) << "Skipped" << m_skipped << "entries under" << drive.rootPath;
        }
        return true;
    }
}
