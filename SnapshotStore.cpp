// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QCryptographicHash>
#include <QDataStream>
#include <QDir>
#include <QFile>
#include <QSaveFile>

#include "Logging.h"
#include "SnapshotStore.h"

namespace IndexEngine {
    static constexpr quint32 kSnapshotVersion = 1;
    static constexpr quint64 kSnapshotMagic   = 0x464E4458534E4150ULL; // "FNDXSNAP" (8 bytes)

    static constexpr quint8 kFlagIsDir = 1u << 0;

    static constexpr quint32 kMaxNameBytes = 4096;
    static constexpr quint32 kMaxPathBytes = 64 * 1024;
    static constexpr quint64 kMaxRecords = 500'000'000ULL;

    SnapshotStore::SnapshotStore(QString directory)
        : m_dir(std::move(directory)) {
    }

    QString SnapshotStore::escapeDriveIdForFilename(const QString& driveId) {
        // Stable + filesystem-safe: sha1 hex of the drive id
        const QByteArray h = QCryptographicHash::hash(driveId.toUtf8(), QCryptographicHash::Sha1);
        return QString::fromLatin1(h.toHex());
    }

    QString SnapshotStore::pathFor(const QString& driveId) const {
        return QDir(m_dir).filePath(escapeDriveIdForFilename(driveId) + QStringLiteral(".fdx"));
    }

    bool SnapshotStore::save(const QString& driveId, const DriveStore& store, QString* errorOut) const {
        if (!QDir().mkpath(m_dir)) {
            if (errorOut) *errorOut = QStringLiteral("Failed to create snapshot directory: %1").arg(m_dir);
            return false;
        }

        const QString path = pathFor(driveId);

        QSaveFile f(path);
        if (!f.open(QIODevice::WriteOnly)) {
            if (errorOut) *errorOut = QStringLiteral("Failed to open snapshot for writing: %1").arg(path);
            return false;
        }

        QDataStream s(&f);
        s.setByteOrder(QDataStream::LittleEndian);

        s << static_cast<quint64>(kSnapshotMagic);
        s << static_cast<quint32>(kSnapshotVersion);

        auto writeBytes = [&](const char* data, size_t len) {
            s << static_cast<quint32>(len);
            if (len > 0) s.writeRawData(data, static_cast<int>(len));
        };

        const QByteArray idBytes = driveId.toUtf8();
        writeBytes(idBytes.constData(), static_cast<size_t>(idBytes.size()));

        s << static_cast<quint64>(store.generationId);
        s << static_cast<qint64>(store.indexedAt);
        s << static_cast<quint64>(store.liveCount());

        for (quint32 id = 0; id < store.slotCount(); ++id) {
            if (!store.isLive(id)) continue;

            const IndexedFile& rec = store.record(id);
            writeBytes(rec.name.data(), rec.name.size());
            writeBytes(rec.fullPath.data(), rec.fullPath.size());
            s << static_cast<quint64>(rec.size);
            s << static_cast<qint64>(rec.mtime);
            s << static_cast<quint8>(rec.isDir ? kFlagIsDir : 0);
            s << static_cast<quint8>(rec.attributes);
        }

        if (s.status() != QDataStream::Ok) {
            if (errorOut) *errorOut = QStringLiteral("Failed while writing snapshot stream.");
            return false;
        }

        if (!f.commit()) {
            if (errorOut) *errorOut = QStringLiteral("Failed to commit snapshot atomically.");
            return false;
        }

        return true;
    }

    std::optional<DriveStore> SnapshotStore::load(const QString& driveId, QString* errorOut) const {
        const QString path = pathFor(driveId);

        QFile f(path);
        if (!f.exists()) {
            if (errorOut) *errorOut = QStringLiteral("No snapshot for %1").arg(driveId);
            return std::nullopt;
        }
        if (!f.open(QIODevice::ReadOnly)) {
            if (errorOut) *errorOut = QStringLiteral("Failed to open snapshot: %1").arg(path);
            return std::nullopt;
        }

        QDataStream s(&f);
        s.setByteOrder(QDataStream::LittleEndian);

        quint64 magic = 0;
        quint32 ver = 0;
        s >> magic >> ver;

        if (magic != kSnapshotMagic || ver != kSnapshotVersion) {
            if (errorOut) *errorOut = QStringLiteral("Snapshot header/version mismatch.");
            return std::nullopt;
        }

        auto readBytes = [&](quint32 maxBytes, std::string& out) -> bool {
            quint32 n = 0;
            s >> n;
            if (s.status() != QDataStream::Ok || n > maxBytes) return false;
            out.resize(n);
            if (n == 0) return true;
            return s.readRawData(out.data(), static_cast<int>(n)) == static_cast<int>(n);
        };

        std::string storedId;
        if (!readBytes(kMaxNameBytes, storedId) || QString::fromStdString(storedId) != driveId) {
            if (errorOut) *errorOut = QStringLiteral("Snapshot belongs to another drive.");
            return std::nullopt;
        }

        quint64 generation = 0;
        qint64 indexedAt = 0;
        quint64 recordCount = 0;
        s >> generation >> indexedAt >> recordCount;

        if (s.status() != QDataStream::Ok || recordCount > kMaxRecords) {
            if (errorOut) *errorOut = QStringLiteral("Invalid recordCount in snapshot.");
            return std::nullopt;
        }

        DriveStore store;
        store.indexedAt = indexedAt;

        for (quint64 i = 0; i < recordCount; ++i) {
            RawEntry e;
            quint64 size = 0;
            qint64 mtime = 0;
            quint8 flags = 0;
            quint8 attributes = 0;

            if (!readBytes(kMaxNameBytes, e.name) || !readBytes(kMaxPathBytes, e.fullPath)) {
                if (errorOut) *errorOut = QStringLiteral("Truncated snapshot (record %1).").arg(i);
                return std::nullopt;
            }
            s >> size >> mtime >> flags >> attributes;
            if (s.status() != QDataStream::Ok) {
                if (errorOut) *errorOut = QStringLiteral("Truncated snapshot (record %1).").arg(i);
                return std::nullopt;
            }

            e.size = size;
            e.mtime = mtime;
            e.isDir = (flags & kFlagIsDir) != 0;
            e.attributes = attributes;
            store.append(std::move(e));
        }

        qCDebug(lcIndex) << "Loaded snapshot" << path << "generation" << generation << "records" << recordCount;
        return store;
    }

    bool SnapshotStore::remove(const QString& driveId) const {
        return QFile::remove(pathFor(driveId));
    }
}
