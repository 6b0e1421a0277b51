// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "IndexEngine.h"
#include "Utils.h"

namespace IndexEngine {
    IndexedFile makeIndexedFile(RawEntry entry) {
        IndexedFile f;
        f.name = std::move(entry.name);
        f.fullPath = std::move(entry.fullPath);
        f.size = entry.isDir ? 0 : entry.size;
        f.mtime = entry.mtime;
        f.isDir = entry.isDir;
        f.attributes = entry.attributes;

        // Directories never carry an extension, even "photos.2024"
        if (!f.isDir) {
            f.extension = Utils::extensionOf(Utils::toLowerUtf8(f.name));
        }
        return f;
    }

    QString stateName(IndexState::Kind kind) {
        switch (kind) {
            case IndexState::Kind::NotBuilt: return QStringLiteral("notBuilt");
            case IndexState::Kind::Building: return QStringLiteral("building");
            case IndexState::Kind::Ready:    return QStringLiteral("ready");
            case IndexState::Kind::Failed:   return QStringLiteral("failed");
        }
        return QStringLiteral("unknown");
    }
}
