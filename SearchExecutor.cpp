// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>

#include "Logging.h"
#include "SearchExecutor.h"
#include "Utils.h"

namespace IndexEngine {
    using QueryCompiler::Atom;
    using QueryCompiler::AtomGroup;
    using QueryCompiler::FilterClause;
    using QueryCompiler::FilterSet;
    using QueryCompiler::Query;

    AtomPredicate::AtomPredicate(const Atom& atom, MatchScope scope)
        : m_atom(atom)
        , m_scope(scope) {
        if (m_atom.kind == Atom::Kind::Wildcard) {
            m_matcher.emplace(m_atom.text);
        }
    }

    bool AtomPredicate::matches(const DriveStore& store, quint32 id) const {
        if (m_matcher) {
            return m_matcher->matchesFullPath() ? m_matcher->matches(store.lowerPath(id))
                                                : m_matcher->matches(store.lowerName(id));
        }

        if (Utils::contains(store.lowerName(id), m_atom.text)) return true;
        return m_scope == MatchScope::NameOrPath && Utils::contains(store.lowerPath(id), m_atom.text);
    }

    std::vector<quint32> AtomPredicate::allMatches(const DriveStore& store) const {
        if (m_matcher) {
            return store.matchWildcard(m_atom.text);
        }
        return store.matchLiteral(m_atom.text, m_scope);
    }

    bool AtomPredicate::isIndexed() const {
        if (m_matcher) return false;
        if (Utils::characterCount(m_atom.text) < 3) return false;
        return !(m_scope == MatchScope::NameOrPath && Utils::containsPathSeparator(m_atom.text));
    }

    namespace SearchExecutor {
        namespace {
            struct GroupPredicate {
                std::vector<AtomPredicate> atoms;

                [[nodiscard]] bool matches(const DriveStore& store, quint32 id) const {
                    return std::any_of(atoms.begin(), atoms.end(),
                                       [&](const AtomPredicate& a) { return a.matches(store, id); });
                }

                [[nodiscard]] bool isIndexed() const {
                    return std::all_of(atoms.begin(), atoms.end(),
                                       [](const AtomPredicate& a) { return a.isIndexed(); });
                }

                [[nodiscard]] std::vector<quint32> allMatches(const DriveStore& store) const {
                    std::vector<quint32> out;
                    for (const AtomPredicate& a : atoms) {
                        std::vector<quint32> hits = a.allMatches(store);
                        if (out.empty()) {
                            out = std::move(hits);
                            continue;
                        }
                        std::vector<quint32> merged;
                        merged.reserve(out.size() + hits.size());
                        std::set_union(out.begin(), out.end(), hits.begin(), hits.end(), std::back_inserter(merged));
                        out = std::move(merged);
                    }
                    return out;
                }
            };

            std::vector<quint32> intersectSorted(const std::vector<quint32>& a, const std::vector<quint32>& b) {
                std::vector<quint32> out;
                out.reserve(std::min(a.size(), b.size()));
                std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
                return out;
            }

            bool clausePasses(const DriveStore& store, quint32 id, const FilterClause& clause, int64_t now) {
                const IndexedFile& rec = store.record(id);

                switch (clause.kind) {
                    case FilterClause::Kind::Extension:
                        return std::find(clause.texts.begin(), clause.texts.end(), rec.extension) != clause.texts.end() &&
                               !rec.extension.empty();
                    case FilterClause::Kind::Size:
                        return std::any_of(clause.ranges.begin(), clause.ranges.end(),
                                           [&](const auto& r) { return r.contains(rec.size); });
                    case FilterClause::Kind::PathLength:
                        return std::any_of(clause.ranges.begin(), clause.ranges.end(),
                                           [&](const auto& r) { return r.contains(store.pathLength(id)); });
                    case FilterClause::Kind::DateModified:
                        return std::any_of(clause.dates.begin(), clause.dates.end(),
                                           [&](const auto& d) { return d.contains(rec.mtime, now); });
                    case FilterClause::Kind::Attributes:
                        return std::any_of(clause.masks.begin(), clause.masks.end(),
                                           [&](quint8 m) { return (rec.attributes & m) == m; });
                    case FilterClause::Kind::PathContains:
                        return std::any_of(clause.texts.begin(), clause.texts.end(),
                                           [&](const std::string& t) { return Utils::contains(store.lowerPath(id), t); });
                    case FilterClause::Kind::FilesOnly:
                        return !rec.isDir;
                    case FilterClause::Kind::FoldersOnly:
                        return rec.isDir;
                }
                return false;
            }

            // Starting set for a query without keyword groups.
            std::vector<quint32> baseCandidates(const DriveStore& store, const FilterSet& filters) {
                const FilterClause* ext = filters.first(FilterClause::Kind::Extension);
                if (!ext) {
                    return store.liveIds();
                }

                std::vector<quint32> out;
                for (const std::string& e : ext->texts) {
                    const std::vector<quint32> ids = store.idsWithExtension(e);
                    out.insert(out.end(), ids.begin(), ids.end());
                }
                std::sort(out.begin(), out.end());
                out.erase(std::unique(out.begin(), out.end()), out.end());
                return out;
            }
        }

        bool passesFilters(const DriveStore& store, quint32 id, const FilterSet& filters, int64_t now) {
            return std::all_of(filters.clauses.begin(), filters.clauses.end(),
                               [&](const FilterClause& c) { return clausePasses(store, id, c, now); });
        }

        std::vector<quint32> evaluate(const DriveStore& store, const Query& query, MatchScope scope, int64_t now) {
            std::vector<GroupPredicate> groups;
            groups.reserve(query.groups.size());
            for (const AtomGroup& g : query.groups) {
                GroupPredicate p;
                for (const Atom& a : g) p.atoms.emplace_back(a, scope);
                groups.push_back(std::move(p));
            }

            std::vector<AtomPredicate> excluded;
            excluded.reserve(query.excluded.size());
            for (const Atom& a : query.excluded) excluded.emplace_back(a, scope);

            // Candidate set: intersect every group the trigram index can answer.
            // The remaining groups are verified per record on that (smaller) set.
            std::vector<quint32> candidates;
            std::vector<const GroupPredicate*> toVerify;
            bool haveCandidates = false;

            for (const GroupPredicate& g : groups) {
                if (!g.isIndexed()) {
                    toVerify.push_back(&g);
                    continue;
                }
                std::vector<quint32> hits = g.allMatches(store);
                candidates = haveCandidates ? intersectSorted(candidates, hits) : std::move(hits);
                haveCandidates = true;
                if (candidates.empty()) return {};
            }

            if (!haveCandidates) {
                if (!toVerify.empty()) {
                    candidates = toVerify.front()->allMatches(store);
                    toVerify.erase(toVerify.begin());
                } else {
                    candidates = baseCandidates(store, query.filters);
                }
            }

            std::vector<quint32> out;
            out.reserve(candidates.size());
            for (const quint32 id : candidates) {
                if (!store.isLive(id)) continue;

                const bool groupsOk = std::all_of(toVerify.begin(), toVerify.end(),
                                                  [&](const GroupPredicate* g) { return g->matches(store, id); });
                if (!groupsOk) continue;

                const bool isExcluded = std::any_of(excluded.begin(), excluded.end(),
                                                    [&](const AtomPredicate& a) { return a.matches(store, id); });
                if (isExcluded) continue;

                if (!passesFilters(store, id, query.filters, now)) continue;

                out.push_back(id);
            }
            return out;
        }

        ExecutionResult execute(const QString& driveId, const DriveStore& store, const Query& query,
                                const SearchSettings& settings, int64_t now, const BatchSink& sink,
                                const std::atomic_bool* cancelled) {
            ExecutionResult result;

            auto isCancelled = [cancelled]() {
                return cancelled && cancelled->load(std::memory_order_acquire);
            };

            if (isCancelled()) {
                result.cancelled = true;
                return result;
            }

            const std::vector<quint32> hits = evaluate(store, query, settings.matchScope, now);
            result.matched = static_cast<quint64>(hits.size());

            const size_t cap = static_cast<size_t>(std::max(settings.maxResultsPerDrive, 0));
            const size_t toEmit = std::min(hits.size(), cap);
            result.truncated = hits.size() > toEmit;

            const size_t batchSize = static_cast<size_t>(std::max(settings.batchSize, 1));
            quint32 sequence = 0;

            for (size_t pos = 0; pos < toEmit; pos += batchSize) {
                if (isCancelled()) {
                    result.cancelled = true;
                    return result;
                }

                ResultBatch batch;
                batch.driveId = driveId;
                batch.generationId = store.generationId;
                batch.sequence = sequence++;

                const size_t end = std::min(pos + batchSize, toEmit);
                batch.hits.reserve(end - pos);
                for (size_t i = pos; i < end; ++i) {
                    const quint32 id = hits[i];
                    const IndexedFile& rec = store.record(id);
                    batch.hits.push_back(SearchHit{id, rec.name, rec.fullPath, rec.size, rec.mtime, rec.isDir});
                }

                const size_t n = batch.hits.size();
                if (!sink(std::move(batch))) {
                    result.cancelled = true;
                    return result;
                }
                result.emitted += n;
            }

            qCDebug(lcSearch) << "Drive" << driveId << "matched" << result.matched << "emitted" << result.emitted;
            return result;
        }
    }
}
