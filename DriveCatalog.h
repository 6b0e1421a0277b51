// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_DRIVECATALOG_H
#define FINDEX_DRIVECATALOG_H

#include <optional>
#include <string>
#include <vector>

#include <QString>
#include <QStringList>

#include "IndexEngine.h"

namespace DriveCatalog {
    struct MountInfoEntry {
        std::string mountPoint;
        std::string mountSource;
        std::string fsType;
    };

    struct BlockDevice {
        QString deviceId; // "partuuid:xxxx"
        QString devNode;  // "/dev/nvme0n1p2"
        QString partuuid;
        QString fsType;
        QString uuid;
        QString label;
        QStringList mountPoints;
        QString primaryMountPoint;

        [[nodiscard]] bool mounted() const { return !mountPoints.isEmpty(); }
    };

    /**
     * Parses one line of /proc/self/mountinfo:
     *  id parent major:minor root mount_point opts ... - fstype mount_source superopts
     *
     * @return std::nullopt for lines that do not follow the format.
     */
    [[nodiscard]] std::optional<MountInfoEntry> parseMountInfoLine(const std::string& line);

    [[nodiscard]] std::vector<MountInfoEntry> readMountInfo();

    /**
     * Prefers mount points under /mnt or /media, then the shortest path; ties go
     * to the alphabetically first. Empty for an empty list.
     */
    [[nodiscard]] QString pickPrimaryMountPoint(const QStringList& mountPoints);

    struct Superblock {
        QString fsType; // lowercase
        QString uuid;   // lowercase
        QString label;
    };

    /**
     * Reads the filesystem type, UUID and label of a block device in a single libblkid pass.
     *
     * @return std::nullopt with a reason if the device cannot be opened or holds no
     *         (or more than one) recognizable filesystem.
     */
    [[nodiscard]] std::optional<Superblock> readSuperblock(const std::string& devNode, QString* errorOut = nullptr);

    /**
     * Every partition listed under /dev/disk/by-partuuid, with filesystem details
     * and the places it is mounted.
     */
    [[nodiscard]] std::vector<BlockDevice> listBlockDevices();

    /**
     * Mounted partitions as indexable drives, rooted at their primary mount point.
     *
     * @param fsTypes Filesystem types to include (lowercase); empty means all.
     */
    [[nodiscard]] std::vector<IndexEngine::DriveInfo> mountedDrives(const QStringList& fsTypes = {});
}

#endif //FINDEX_DRIVECATALOG_H
