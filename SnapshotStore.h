// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_SNAPSHOTSTORE_H
#define FINDEX_SNAPSHOTSTORE_H

#include <optional>

#include <QString>

#include "DriveStore.h"

namespace IndexEngine {
    /**
     * Persists generations so a restart does not have to walk every drive again.
     *
     * One file per drive, named after the SHA-1 of the drive id. Only live records
     * are written; the lookup indices are rebuilt on load, so record ids of a
     * restored generation start a new lineage.
     */
    class SnapshotStore {
    public:
        explicit SnapshotStore(QString directory);

        [[nodiscard]] const QString& directory() const { return m_dir; }
        [[nodiscard]] QString pathFor(const QString& driveId) const;

        /**
         * Writes the snapshot atomically (QSaveFile).
         *
         * @return false with a reason if the directory or file cannot be written.
         */
        bool save(const QString& driveId, const DriveStore& store, QString* errorOut = nullptr) const;

        /**
         * Reads a snapshot back into a fresh DriveStore.
         *
         * @return std::nullopt if there is no snapshot, or it is corrupt or belongs to another drive.
         */
        [[nodiscard]] std::optional<DriveStore> load(const QString& driveId, QString* errorOut = nullptr) const;

        bool remove(const QString& driveId) const;

        [[nodiscard]] static QString escapeDriveIdForFilename(const QString& driveId);

    private:
        QString m_dir;
    };
}

#endif //FINDEX_SNAPSHOTSTORE_H
