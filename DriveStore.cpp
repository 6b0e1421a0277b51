// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>

// TBB and Qt both want 'emit'.
#ifdef emit
#define QT_EMIT_BACKUP emit
#undef emit
#endif

#include <tbb/blocked_range.h>
#include <tbb/enumerable_thread_specific.h>
#include <tbb/parallel_for.h>

#ifdef QT_EMIT_BACKUP
#define emit QT_EMIT_BACKUP
#undef QT_EMIT_BACKUP
#endif

#include "DriveStore.h"
#include "Utils.h"
#include "WildcardMatcher.h"

namespace IndexEngine {
    namespace {
        void eraseSorted(std::vector<quint32>& bucket, quint32 id) {
            const auto it = std::lower_bound(bucket.begin(), bucket.end(), id);
            if (it != bucket.end() && *it == id) {
                bucket.erase(it);
            }
        }

        template <typename Map, typename Key>
        void eraseFromBucket(Map& index, const Key& key, quint32 id) {
            const auto it = index.find(key);
            if (it == index.end()) return;

            eraseSorted(it->second, id);
            if (it->second.empty()) {
                index.erase(it);
            }
        }

        // Both inputs ascending. Result ascending, no duplicates.
        std::vector<quint32> mergeUnion(const std::vector<quint32>& a, const std::vector<quint32>& b) {
            std::vector<quint32> out;
            out.reserve(a.size() + b.size());
            std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
            return out;
        }

        // Directory part of a full path, including the trailing separator, or an
        // empty view when the path does not end with the given name.
        std::string_view parentPrefix(std::string_view fullPath, std::string_view name) {
            if (name.empty() || fullPath.size() <= name.size()) return {};
            if (fullPath.substr(fullPath.size() - name.size()) != name) return {};

            const std::string_view prefix = fullPath.substr(0, fullPath.size() - name.size());
            if (!Utils::isPathSeparator(static_cast<char32_t>(prefix.back()))) return {};
            return prefix;
        }
    }

    quint32 DriveStore::append(IndexedFile file) {
        const quint32 id = static_cast<quint32>(m_records.size());

        RecordKeys keys;
        keys.nameLower = Utils::toLowerUtf8(file.name);

        const std::string_view prefix = parentPrefix(file.fullPath, file.name);
        std::string prefixLower;
        if (!prefix.empty()) {
            prefixLower = Utils::toLowerUtf8(prefix);
            keys.pathLower = prefixLower + keys.nameLower;
        } else {
            // Path does not decompose into prefix + name; the whole path acts as
            // its own directory bucket so path matching stays exact.
            keys.pathLower = Utils::toLowerUtf8(file.fullPath);
            prefixLower = keys.pathLower;
        }
        keys.pathLength = static_cast<quint32>(Utils::characterCount(file.fullPath));

        auto dirIt = m_dirIdByPrefix.find(prefixLower);
        if (dirIt == m_dirIdByPrefix.end()) {
            const quint32 dirId = static_cast<quint32>(m_dirs.size());
            m_dirs.push_back(DirectoryBucket{prefixLower, {}});
            dirIt = m_dirIdByPrefix.emplace(std::move(prefixLower), dirId).first;
        }
        keys.dirId = dirIt->second;

        // Ids only grow, so push_back keeps every bucket sorted.
        m_dirs[keys.dirId].members.push_back(id);
        m_nameIndex[keys.nameLower].push_back(id);
        if (!file.isDir && !file.extension.empty()) {
            m_extIndex[file.extension].push_back(id);
        }
        for (const uint64_t tri : Utils::trigramsOf(Utils::toCodePoints(keys.nameLower))) {
            m_trigramIndex[tri].push_back(id);
        }

        m_records.push_back(std::move(file));
        m_keys.push_back(std::move(keys));
        m_live.push_back(1);
        ++m_liveCount;

        return id;
    }

    bool DriveStore::remove(quint32 recordId) {
        if (!isLive(recordId)) {
            return false;
        }

        const IndexedFile& rec = m_records[recordId];
        const RecordKeys& keys = m_keys[recordId];

        eraseFromBucket(m_nameIndex, keys.nameLower, recordId);
        if (!rec.isDir && !rec.extension.empty()) {
            eraseFromBucket(m_extIndex, rec.extension, recordId);
        }
        for (const uint64_t tri : Utils::trigramsOf(Utils::toCodePoints(keys.nameLower))) {
            eraseFromBucket(m_trigramIndex, tri, recordId);
        }
        eraseSorted(m_dirs[keys.dirId].members, recordId);

        m_live[recordId] = 0;
        --m_liveCount;
        return true;
    }

    std::vector<quint32> DriveStore::liveIds() const {
        std::vector<quint32> out;
        out.reserve(m_liveCount);
        for (quint32 i = 0; i < m_live.size(); ++i) {
            if (m_live[i]) out.push_back(i);
        }
        return out;
    }

    std::vector<quint32> DriveStore::idsWithExtension(std::string_view lowerExt) const {
        const auto it = m_extIndex.find(std::string(lowerExt));
        if (it == m_extIndex.end()) return {};
        return it->second;
    }

    std::vector<quint32> DriveStore::idsWithName(std::string_view lowerName) const {
        const auto it = m_nameIndex.find(std::string(lowerName));
        if (it == m_nameIndex.end()) return {};
        return it->second;
    }

    std::optional<quint32> DriveStore::findByPath(std::string_view fullPath) const {
        const auto sep = fullPath.find_last_of("/\\");
        const std::string_view name = (sep == std::string_view::npos) ? fullPath : fullPath.substr(sep + 1);
        if (name.empty()) return std::nullopt;

        const auto it = m_nameIndex.find(Utils::toLowerUtf8(name));
        if (it == m_nameIndex.end()) return std::nullopt;

        for (const quint32 id : it->second) {
            if (m_records[id].fullPath == fullPath) {
                return id;
            }
        }
        return std::nullopt;
    }

    std::vector<quint32> DriveStore::trigramCandidates(std::string_view lowerLiteral) const {
        const std::vector<uint64_t> tris = Utils::trigramsOf(Utils::toCodePoints(lowerLiteral));
        if (tris.empty()) return {};

        std::vector<const std::vector<quint32>*> buckets;
        buckets.reserve(tris.size());
        for (const uint64_t tri : tris) {
            const auto it = m_trigramIndex.find(tri);
            if (it == m_trigramIndex.end()) {
                return {}; // no name has this trigram
            }
            buckets.push_back(&it->second);
        }

        // Smallest bucket first keeps every intermediate result small
        std::sort(buckets.begin(), buckets.end(), [](const auto* a, const auto* b) {
            return a->size() < b->size();
        });

        std::vector<quint32> candidates = *buckets.front();
        for (size_t i = 1; i < buckets.size() && !candidates.empty(); ++i) {
            const std::vector<quint32>& bucket = *buckets[i];

            std::vector<quint32> next;
            next.reserve(candidates.size());

            auto aIt = candidates.begin();
            auto bIt = bucket.begin();
            while (aIt != candidates.end() && bIt != bucket.end()) {
                if (*aIt < *bIt) {
                    ++aIt;
                } else if (*bIt < *aIt) {
                    ++bIt;
                } else {
                    next.push_back(*aIt);
                    ++aIt;
                    ++bIt;
                }
            }

            candidates = std::move(next);
        }

        return candidates;
    }

    bool DriveStore::literalMatches(quint32 id, std::string_view lowerLiteral, MatchScope scope) const {
        const RecordKeys& keys = m_keys[id];
        if (Utils::contains(keys.nameLower, lowerLiteral)) return true;
        return scope == MatchScope::NameOrPath && Utils::contains(keys.pathLower, lowerLiteral);
    }

    template <typename Pred>
    std::vector<quint32> DriveStore::parallelScan(Pred&& pred) const {
        tbb::enumerable_thread_specific<std::vector<quint32>> tlsHits;

        tbb::parallel_for(
            tbb::blocked_range<size_t>(0, m_records.size(), 4096),
            [&](const tbb::blocked_range<size_t>& r) {
                auto& local = tlsHits.local();
                for (size_t i = r.begin(); i != r.end(); ++i) {
                    const quint32 id = static_cast<quint32>(i);
                    if (m_live[id] && pred(id)) {
                        local.push_back(id);
                    }
                }
            }
        );

        // Merge thread-local buffers
        size_t total = 0;
        for (const auto& v : tlsHits) total += v.size();

        std::vector<quint32> hits;
        hits.reserve(total);
        for (const auto& v : tlsHits) {
            hits.insert(hits.end(), v.begin(), v.end());
        }
        std::sort(hits.begin(), hits.end());
        return hits;
    }

    std::vector<quint32> DriveStore::matchLiteral(std::string_view lowerLiteral, MatchScope scope) const {
        if (lowerLiteral.empty()) {
            return liveIds();
        }

        const bool useTrigrams = Utils::characterCount(lowerLiteral) >= 3 &&
                                 !(scope == MatchScope::NameOrPath && Utils::containsPathSeparator(lowerLiteral));
        if (!useTrigrams) {
            return parallelScan([&](quint32 id) { return literalMatches(id, lowerLiteral, scope); });
        }

        std::vector<quint32> candidates = trigramCandidates(lowerLiteral);

        if (scope == MatchScope::NameOrPath) {
            // Without a separator the literal cannot span prefix and name, so a
            // path hit implies the directory prefix itself contains it.
            std::vector<quint32> fromDirs;
            for (const DirectoryBucket& dir : m_dirs) {
                if (dir.members.empty() || !Utils::contains(dir.prefixLower, lowerLiteral)) continue;
                fromDirs.insert(fromDirs.end(), dir.members.begin(), dir.members.end());
            }
            if (!fromDirs.empty()) {
                // A record belongs to exactly one directory, so no duplicates here
                std::sort(fromDirs.begin(), fromDirs.end());
                candidates = mergeUnion(candidates, fromDirs);
            }
        }

        std::vector<quint32> hits;
        hits.reserve(candidates.size());
        for (const quint32 id : candidates) {
            if (m_live[id] && literalMatches(id, lowerLiteral, scope)) {
                hits.push_back(id);
            }
        }
        return hits;
    }

    std::vector<quint32> DriveStore::matchWildcard(std::string_view lowerPattern) const {
        const WildcardMatcher matcher(lowerPattern);
        if (matcher.matchesFullPath()) {
            return parallelScan([&](quint32 id) { return matcher.matches(m_keys[id].pathLower); });
        }
        return parallelScan([&](quint32 id) { return matcher.matches(m_keys[id].nameLower); });
    }

    std::vector<quint32> DriveStore::exhaustiveScan(std::string_view lowerLiteral, MatchScope scope) const {
        std::vector<quint32> hits;
        for (quint32 id = 0; id < m_records.size(); ++id) {
            if (m_live[id] && literalMatches(id, lowerLiteral, scope)) {
                hits.push_back(id);
            }
        }
        return hits;
    }

    StoreStats DriveStore::stats() const {
        StoreStats s;
        for (quint32 id = 0; id < m_records.size(); ++id) {
            if (!m_live[id]) continue;

            const IndexedFile& rec = m_records[id];
            ++s.liveRecords;
            if (rec.isDir) {
                ++s.directories;
            } else {
                s.totalBytes += rec.size;
            }
        }
        return s;
    }
}
