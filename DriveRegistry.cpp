// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QMutexLocker>

#include "DriveRegistry.h"
#include "Logging.h"

namespace IndexEngine {
    static QString unknownDrive(const QString& driveId) {
        return QStringLiteral("Unknown drive: %1").arg(driveId);
    }

    bool DriveRegistry::addDrive(const DriveInfo& info, QString* errorOut) {
        if (info.id.isEmpty()) {
            if (errorOut) *errorOut = QStringLiteral("Drive id must not be empty.");
            return false;
        }

        QMutexLocker lock(&m_mutex);
        if (m_slots.contains(info.id)) {
            if (errorOut) *errorOut = QStringLiteral("Drive already registered: %1").arg(info.id);
            return false;
        }

        m_slots.emplace(info.id, Slot{info, IndexState{}, nullptr});
        return true;
    }

    bool DriveRegistry::hasDrive(const QString& driveId) const {
        QMutexLocker lock(&m_mutex);
        return m_slots.contains(driveId);
    }

    QStringList DriveRegistry::driveIds() const {
        QMutexLocker lock(&m_mutex);
        QStringList out;
        out.reserve(static_cast<qsizetype>(m_slots.size()));
        for (const auto& kv : m_slots) out.push_back(kv.first);
        return out;
    }

    std::optional<DriveEntry> DriveRegistry::entry(const QString& driveId) const {
        QMutexLocker lock(&m_mutex);
        const auto it = m_slots.find(driveId);
        if (it == m_slots.end()) return std::nullopt;
        return DriveEntry{it->second.info, it->second.state, it->second.generation};
    }

    std::vector<DriveEntry> DriveRegistry::entries() const {
        QMutexLocker lock(&m_mutex);
        std::vector<DriveEntry> out;
        out.reserve(m_slots.size());
        for (const auto& kv : m_slots) {
            out.push_back(DriveEntry{kv.second.info, kv.second.state, kv.second.generation});
        }
        return out;
    }

    Generation DriveRegistry::generation(const QString& driveId) const {
        QMutexLocker lock(&m_mutex);
        const auto it = m_slots.find(driveId);
        if (it == m_slots.end()) return nullptr;
        return it->second.generation;
    }

    std::optional<IndexState> DriveRegistry::state(const QString& driveId) const {
        QMutexLocker lock(&m_mutex);
        const auto it = m_slots.find(driveId);
        if (it == m_slots.end()) return std::nullopt;
        return it->second.state;
    }

    bool DriveRegistry::isValidTransition(IndexState::Kind from, IndexState::Kind to) {
        using K = IndexState::Kind;
        switch (to) {
            case K::Building:
                return from == K::NotBuilt || from == K::Ready || from == K::Failed;
            case K::Ready:
            case K::Failed:
                return from == K::Building;
            case K::NotBuilt:
                return false;
        }
        return false;
    }

    bool DriveRegistry::transitionLocked(Slot& slot, IndexState::Kind to, QString* errorOut) {
        if (!isValidTransition(slot.state.kind, to)) {
            if (errorOut) {
                *errorOut = QStringLiteral("Invalid state transition for %1: %2 -> %3")
                                .arg(slot.info.id, stateName(slot.state.kind), stateName(to));
            }
            return false;
        }

        qCDebug(lcIndex) << "Drive" << slot.info.id << stateName(slot.state.kind) << "->" << stateName(to);
        slot.state.kind = to;
        if (to != IndexState::Kind::Failed) {
            slot.state.reason.clear();
        }
        return true;
    }

    quint64 DriveRegistry::publishLocked(Slot& slot, std::shared_ptr<DriveStore> store) {
        const quint64 gen = m_nextGeneration++;
        store->generationId = gen;

        slot.state.generationId = gen;
        slot.state.recordCount = static_cast<quint64>(store->liveCount());
        slot.generation = std::move(store);
        return gen;
    }

    bool DriveRegistry::beginBuild(const QString& driveId, QString* errorOut) {
        QMutexLocker lock(&m_mutex);
        const auto it = m_slots.find(driveId);
        if (it == m_slots.end()) {
            if (errorOut) *errorOut = unknownDrive(driveId);
            return false;
        }
        return transitionLocked(it->second, IndexState::Kind::Building, errorOut);
    }

    bool DriveRegistry::completeBuild(const QString& driveId, std::shared_ptr<DriveStore> store,
                                      quint64* generationOut, QString* errorOut) {
        if (!store) {
            if (errorOut) *errorOut = QStringLiteral("No generation to publish.");
            return false;
        }

        QMutexLocker lock(&m_mutex);
        const auto it = m_slots.find(driveId);
        if (it == m_slots.end()) {
            if (errorOut) *errorOut = unknownDrive(driveId);
            return false;
        }
        if (!transitionLocked(it->second, IndexState::Kind::Ready, errorOut)) {
            return false;
        }

        const quint64 gen = publishLocked(it->second, std::move(store));
        if (generationOut) *generationOut = gen;
        return true;
    }

    bool DriveRegistry::failBuild(const QString& driveId, const QString& reason, QString* errorOut) {
        QMutexLocker lock(&m_mutex);
        const auto it = m_slots.find(driveId);
        if (it == m_slots.end()) {
            if (errorOut) *errorOut = unknownDrive(driveId);
            return false;
        }
        if (!transitionLocked(it->second, IndexState::Kind::Failed, errorOut)) {
            return false;
        }

        it->second.state.reason = reason;
        return true;
    }

    bool DriveRegistry::replaceGeneration(const QString& driveId, std::shared_ptr<DriveStore> store,
                                          quint64* generationOut, QString* errorOut) {
        if (!store) {
            if (errorOut) *errorOut = QStringLiteral("No generation to publish.");
            return false;
        }

        QMutexLocker lock(&m_mutex);
        const auto it = m_slots.find(driveId);
        if (it == m_slots.end()) {
            if (errorOut) *errorOut = unknownDrive(driveId);
            return false;
        }
        if (!it->second.generation) {
            if (errorOut) *errorOut = QStringLiteral("Drive %1 has no published index.").arg(driveId);
            return false;
        }

        const quint64 gen = publishLocked(it->second, std::move(store));
        if (generationOut) *generationOut = gen;
        return true;
    }
}
