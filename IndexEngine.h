// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_INDEXENGINE_H
#define FINDEX_INDEXENGINE_H

#include <cstdint>
#include <string>
#include <vector>

#include <QString>
#include <QStringList>

namespace IndexEngine {
    inline constexpr quint32 kInvalidRecord = 0xFFFFFFFFu;

    enum FileAttribute : quint8 {
        AttrHidden   = 1u << 0,
        AttrReadOnly = 1u << 1,
    };

    /**
     * One entry as produced by a filesystem walker. The walk itself is not part of
     * the index: walkers hand these over one at a time and the store derives the rest.
     */
    struct RawEntry {
        std::string name;
        std::string fullPath;
        uint64_t size = 0;
        int64_t mtime = 0; // seconds since epoch
        bool isDir = false;
        quint8 attributes = 0;
    };

    /**
     * Snapshot of a single filesystem entry at index time. Immutable once it has
     * been appended to a DriveStore.
     */
    struct IndexedFile {
        std::string name;
        std::string fullPath;
        uint64_t size = 0;
        int64_t mtime = 0;
        bool isDir = false;
        std::string extension; // lowercase, no dot, empty for directories
        quint8 attributes = 0;

        bool operator==(const IndexedFile& o) const = default;
    };

    [[nodiscard]] IndexedFile makeIndexedFile(RawEntry entry);

    /**
     * Describes one independently indexed root. Walkers use rootPath; the raw ext4
     * walker additionally needs devNode and fsType.
     */
    struct DriveInfo {
        QString id;       // stable id, e.g. "path:/home" or "partuuid:xxxx"
        QString rootPath; // where full paths start
        QString devNode;  // optional, e.g. "/dev/nvme0n1p2"
        QString fsType;   // optional, e.g. "ext4"
        QString label;
        QString uuid;
    };

    struct IndexState {
        enum class Kind : quint8 { NotBuilt, Building, Ready, Failed };

        Kind kind = Kind::NotBuilt;

        // Latest published generation, if any (also kept while Building/Failed).
        quint64 recordCount = 0;
        quint64 generationId = 0;

        QString reason; // only meaningful for Failed

        [[nodiscard]] bool hasGeneration() const { return generationId != 0; }

        bool operator==(const IndexState& o) const = default;
    };

    [[nodiscard]] QString stateName(IndexState::Kind kind);

    /**
     * A scope selects either every known drive or exactly one.
     */
    struct DriveScope {
        bool allDrives = true;
        QString driveId;

        [[nodiscard]] static DriveScope all() { return DriveScope{}; }
        [[nodiscard]] static DriveScope drive(const QString& id) { return DriveScope{false, id}; }
    };
}

#endif //FINDEX_INDEXENGINE_H
