// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_DRIVEREGISTRY_H
#define FINDEX_DRIVEREGISTRY_H

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include <QMutex>
#include <QString>
#include <QStringList>

#include "DriveStore.h"

namespace IndexEngine {
    using Generation = std::shared_ptr<const DriveStore>;

    struct DriveEntry {
        DriveInfo info;
        IndexState state;
        Generation generation;
    };

    /**
     * Owns the state machine and the published generation of every drive.
     *
     * All state changes go through this class and are validated against a single
     * transition table. The lock is only held to change a state or to copy/swap a
     * generation pointer; readers keep the generation they copied alive on their own.
     */
    class DriveRegistry {
    public:
        DriveRegistry() = default;
        DriveRegistry(const DriveRegistry&) = delete;
        DriveRegistry& operator=(const DriveRegistry&) = delete;

        /**
         * @return false (with a reason) if the id is empty or already registered.
         */
        bool addDrive(const DriveInfo& info, QString* errorOut = nullptr);

        [[nodiscard]] bool hasDrive(const QString& driveId) const;
        [[nodiscard]] QStringList driveIds() const; // sorted
        [[nodiscard]] std::optional<DriveEntry> entry(const QString& driveId) const;
        [[nodiscard]] std::vector<DriveEntry> entries() const;

        [[nodiscard]] Generation generation(const QString& driveId) const;
        [[nodiscard]] std::optional<IndexState> state(const QString& driveId) const;

        [[nodiscard]] static bool isValidTransition(IndexState::Kind from, IndexState::Kind to);

        /**
         * NotBuilt/Ready/Failed -> Building. Fails if the drive is already Building.
         */
        bool beginBuild(const QString& driveId, QString* errorOut = nullptr);

        /**
         * Building -> Ready, publishing the new generation. Assigns its generationId.
         */
        bool completeBuild(const QString& driveId, std::shared_ptr<DriveStore> store,
                           quint64* generationOut = nullptr, QString* errorOut = nullptr);

        /**
         * Building -> Failed. The previously published generation stays in place.
         */
        bool failBuild(const QString& driveId, const QString& reason, QString* errorOut = nullptr);

        /**
         * Publishes a modified copy of the current generation without changing the
         * state kind. Requires a generation to be published already.
         */
        bool replaceGeneration(const QString& driveId, std::shared_ptr<DriveStore> store,
                               quint64* generationOut = nullptr, QString* errorOut = nullptr);

    private:
        struct Slot {
            DriveInfo info;
            IndexState state;
            Generation generation;
        };

        bool transitionLocked(Slot& slot, IndexState::Kind to, QString* errorOut);
        quint64 publishLocked(Slot& slot, std::shared_ptr<DriveStore> store);

        mutable QMutex m_mutex;
        std::map<QString, Slot> m_slots;
        quint64 m_nextGeneration = 1;
    };
}

#endif //FINDEX_DRIVEREGISTRY_H
