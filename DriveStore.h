// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_DRIVESTORE_H
#define FINDEX_DRIVESTORE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "IndexEngine.h"

namespace IndexEngine {
    enum class MatchScope : quint8 {
        NameOnly,   // keywords are tested against the file name
        NameOrPath, // keywords are tested against the name or the full path
    };

    struct StoreStats {
        quint64 liveRecords = 0;
        quint64 directories = 0;
        quint64 totalBytes = 0;
    };

    /**
     * One generation of a drive's index: the record array plus every lookup
     * structure derived from it.
     *
     * Record ids are insertion order and never reused. Removal only tombstones a
     * record, so ids held by a caller stay valid for as long as it holds this
     * generation (or a clone of it).
     *
     * A published DriveStore is never mutated; deltas are applied to a copy.
     */
    class DriveStore {
    public:
        DriveStore() = default;
        DriveStore(const DriveStore&) = default;
        DriveStore& operator=(const DriveStore&) = default;
        DriveStore(DriveStore&&) noexcept = default;
        DriveStore& operator=(DriveStore&&) noexcept = default;

        // Set by the lifecycle manager when the generation is published.
        quint64 generationId = 0;
        int64_t indexedAt = 0; // unix seconds

        /**
         * Appends a record and updates every index.
         *
         * @param file The record to store.
         * @return The id assigned to it (the previous slotCount()).
         */
        quint32 append(IndexedFile file);

        quint32 append(RawEntry entry) { return append(makeIndexedFile(std::move(entry))); }

        /**
         * Tombstones a record and purges it from every bucket.
         *
         * @return false if the id is unknown or already removed.
         */
        bool remove(quint32 recordId);

        [[nodiscard]] size_t slotCount() const { return m_records.size(); }
        [[nodiscard]] size_t liveCount() const { return m_liveCount; }
        [[nodiscard]] bool isLive(quint32 recordId) const {
            return recordId < m_live.size() && m_live[recordId] != 0;
        }

        [[nodiscard]] const IndexedFile& record(quint32 recordId) const { return m_records[recordId]; }
        [[nodiscard]] std::string_view lowerName(quint32 recordId) const { return m_keys[recordId].nameLower; }
        [[nodiscard]] std::string_view lowerPath(quint32 recordId) const { return m_keys[recordId].pathLower; }
        [[nodiscard]] quint32 pathLength(quint32 recordId) const { return m_keys[recordId].pathLength; }

        [[nodiscard]] std::vector<quint32> liveIds() const;
        [[nodiscard]] std::vector<quint32> idsWithExtension(std::string_view lowerExt) const;
        [[nodiscard]] std::vector<quint32> idsWithName(std::string_view lowerName) const;

        /**
         * Resolves a full path (exact, case-sensitive) to the live record holding it.
         */
        [[nodiscard]] std::optional<quint32> findByPath(std::string_view fullPath) const;

        /**
         * Ids whose lowercase name contains every trigram of the literal. The
         * result is a superset of the true name matches and must be verified.
         * Empty for literals shorter than 3 characters.
         */
        [[nodiscard]] std::vector<quint32> trigramCandidates(std::string_view lowerLiteral) const;

        /**
         * Verified matches of a literal keyword, ascending ids.
         * Uses the trigram index when the literal has at least 3 characters,
         * otherwise a parallel linear scan.
         */
        [[nodiscard]] std::vector<quint32> matchLiteral(std::string_view lowerLiteral, MatchScope scope) const;

        /**
         * Verified matches of a wildcard pattern, ascending ids. The pattern must
         * match the whole name, or the whole full path if it contains a separator.
         */
        [[nodiscard]] std::vector<quint32> matchWildcard(std::string_view lowerPattern) const;

        /**
         * Sequential scan of every live record. Reference result for matchLiteral().
         */
        [[nodiscard]] std::vector<quint32> exhaustiveScan(std::string_view lowerLiteral, MatchScope scope) const;

        [[nodiscard]] StoreStats stats() const;

        [[nodiscard]] size_t trigramBucketCount() const { return m_trigramIndex.size(); }

    private:
        struct RecordKeys {
            std::string nameLower;
            std::string pathLower;
            quint32 pathLength = 0; // characters
            quint32 dirId = 0;
        };

        // One entry per distinct parent directory prefix ("/home/user/").
        struct DirectoryBucket {
            std::string prefixLower;
            std::vector<quint32> members;
        };

        [[nodiscard]] bool literalMatches(quint32 id, std::string_view lowerLiteral, MatchScope scope) const;

        template <typename Pred>
        [[nodiscard]] std::vector<quint32> parallelScan(Pred&& pred) const;

        std::vector<IndexedFile> m_records;
        std::vector<RecordKeys> m_keys;
        std::vector<quint8> m_live;
        size_t m_liveCount = 0;

        std::unordered_map<std::string, std::vector<quint32>> m_nameIndex;
        std::unordered_map<std::string, std::vector<quint32>> m_extIndex;
        std::unordered_map<uint64_t, std::vector<quint32>> m_trigramIndex;

        std::vector<DirectoryBucket> m_dirs;
        std::unordered_map<std::string, quint32> m_dirIdByPrefix;
    };
}

#endif //FINDEX_DRIVESTORE_H
