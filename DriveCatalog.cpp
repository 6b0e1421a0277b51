// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <tuple>

#include <blkid/blkid.h>

#include "DriveCatalog.h"
#include "Logging.h"

namespace DriveCatalog {
    std::optional<MountInfoEntry> parseMountInfoLine(const std::string& line) {
        const auto sep = line.find(" - ");
        if (sep == std::string::npos) return std::nullopt;

        const std::string left = line.substr(0, sep);
        const std::string right = line.substr(sep + 3);

        // left: id, parent, maj:min, root, mount_point, opts
        std::string id, parent, majmin, root, mountPoint, opts;
        {
            std::istringstream iss(left);
            if (!(iss >> id >> parent >> majmin >> root >> mountPoint >> opts)) return std::nullopt;
        }

        // right: fstype mount_source superopts
        std::string fstype, mountSource, superopts;
        {
            std::istringstream iss(right);
            if (!(iss >> fstype >> mountSource >> superopts)) return std::nullopt;
        }

        // Spaces and tabs in mount points are octal-escaped ("\040")
        std::string decoded;
        decoded.reserve(mountPoint.size());
        for (size_t i = 0; i < mountPoint.size(); ++i) {
            auto isOctal = [&](size_t j) { return mountPoint[j] >= '0' && mountPoint[j] <= '7'; };
            if (mountPoint[i] == '\\' && i + 3 < mountPoint.size() && isOctal(i + 1) && isOctal(i + 2) && isOctal(i + 3)) {
                decoded.push_back(static_cast<char>(std::stoi(mountPoint.substr(i + 1, 3), nullptr, 8)));
                i += 3;
            } else {
                decoded.push_back(mountPoint[i]);
            }
        }

        return MountInfoEntry{decoded, mountSource, fstype};
    }

    std::vector<MountInfoEntry> readMountInfo() {
        std::ifstream f("/proc/self/mountinfo");
        std::vector<MountInfoEntry> out;
        if (!f) return out;

        std::string line;
        while (std::getline(f, line)) {
            if (auto e = parseMountInfoLine(line)) {
                out.push_back(std::move(*e));
            }
        }
        return out;
    }

    QString pickPrimaryMountPoint(const QStringList& mountPoints) {
        // Rank: under /mnt or /media first, then shorter, then alphabetical
        auto rank = [](const QString& mp) {
            const bool preferred = mp == QStringLiteral("/mnt") || mp.startsWith(QStringLiteral("/mnt/")) ||
                                   mp == QStringLiteral("/media") || mp.startsWith(QStringLiteral("/media/"));
            return std::make_tuple(!preferred, mp.size(), mp);
        };

        const auto best = std::min_element(mountPoints.cbegin(), mountPoints.cend(),
                                           [&](const QString& a, const QString& b) { return rank(a) < rank(b); });
        return best == mountPoints.cend() ? QString() : *best;
    }

    std::optional<Superblock> readSuperblock(const std::string& devNode, QString* errorOut) {
        blkid_probe pr = blkid_new_probe_from_filename(devNode.c_str());
        if (!pr) {
            if (errorOut) *errorOut = QStringLiteral("Cannot open %1 for probing").arg(QString::fromStdString(devNode));
            return std::nullopt;
        }

        blkid_probe_enable_superblocks(pr, 1);
        blkid_probe_set_superblocks_flags(pr, BLKID_SUBLKS_TYPE | BLKID_SUBLKS_UUID | BLKID_SUBLKS_LABEL);

        // 1 = nothing found, -2 = ambiguous
        const int rc = blkid_do_safeprobe(pr);
        if (rc != 0) {
            if (errorOut) *errorOut = QStringLiteral("No unambiguous filesystem on %1 (blkid %2)")
                                          .arg(QString::fromStdString(devNode)).arg(rc);
            blkid_free_probe(pr);
            return std::nullopt;
        }

        auto lookup = [pr](const char* key) {
            const char* data = nullptr;
            size_t len = 0;
            if (blkid_probe_lookup_value(pr, key, &data, &len) != 0 || !data) return QString();
            return QString::fromUtf8(data, static_cast<qsizetype>(std::strlen(data)));
        };

        Superblock sb;
        sb.fsType = lookup("TYPE").toLower();
        sb.uuid = lookup("UUID").toLower();
        sb.label = lookup("LABEL");

        blkid_free_probe(pr);
        return sb;
    }

    std::vector<BlockDevice> listBlockDevices() {
        namespace fs = std::filesystem;

        std::vector<BlockDevice> out;

        const fs::path byPartuuidDir("/dev/disk/by-partuuid");
        std::error_code ec;
        if (!fs::is_directory(byPartuuidDir, ec)) {
            qCDebug(lcService) << "No /dev/disk/by-partuuid; no block devices listed";
            return out;
        }

        // Resolved device node -> mount points. Only /dev sources can be matched reliably.
        std::map<std::string, QStringList> mountsByNode;
        for (const MountInfoEntry& mi : readMountInfo()) {
            if (mi.mountSource.rfind("/dev/", 0) != 0) continue;

            std::error_code resolveEc;
            const fs::path node = fs::canonical(mi.mountSource, resolveEc);
            if (resolveEc) continue;
            mountsByNode[node.string()] << QString::fromStdString(mi.mountPoint);
        }

        fs::directory_iterator it(byPartuuidDir, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code resolveEc;
            const fs::path node = fs::canonical(it->path(), resolveEc);
            if (resolveEc) continue;

            BlockDevice dev;
            dev.partuuid = QString::fromStdString(it->path().filename().string());
            dev.deviceId = QStringLiteral("partuuid:") + dev.partuuid;
            dev.devNode = QString::fromStdString(node.string());

            QString sbErr;
            if (const std::optional<Superblock> sb = readSuperblock(node.string(), &sbErr)) {
                dev.fsType = sb->fsType;
                dev.uuid = sb->uuid;
                dev.label = sb->label;
            } else {
                qCDebug(lcService) << sbErr;
            }

            if (const auto m = mountsByNode.find(node.string()); m != mountsByNode.end()) {
                dev.mountPoints = m->second;
                dev.mountPoints.removeDuplicates();
                dev.mountPoints.sort();
            }
            dev.primaryMountPoint = pickPrimaryMountPoint(dev.mountPoints);

            out.push_back(std::move(dev));
        }

        if (ec) {
            qCWarning(lcService) << "Listing block devices failed:" << QString::fromStdString(ec.message());
        }

        std::sort(out.begin(), out.end(), [](const BlockDevice& a, const BlockDevice& b) {
            return a.deviceId < b.deviceId;
        });
        return out;
    }

    std::vector<IndexEngine::DriveInfo> mountedDrives(const QStringList& fsTypes) {
        std::vector<IndexEngine::DriveInfo> out;
        for (const BlockDevice& dev : listBlockDevices()) {
            if (!dev.mounted()) continue;
            if (!fsTypes.isEmpty() && !fsTypes.contains(dev.fsType)) continue;

            IndexEngine::DriveInfo d;
            d.id = dev.deviceId;
            d.rootPath = dev.primaryMountPoint;
            d.devNode = dev.devNode;
            d.fsType = dev.fsType;
            d.label = dev.label;
            d.uuid = dev.uuid;
            out.push_back(std::move(d));
        }
        return out;
    }
}
