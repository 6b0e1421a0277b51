// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_SEARCHEXECUTOR_H
#define FINDEX_SEARCHEXECUTOR_H

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <QString>

#include "DriveStore.h"
#include "QueryCompiler.h"
#include "WildcardMatcher.h"

namespace IndexEngine {
    struct SearchHit {
        quint32 recordId = kInvalidRecord;
        std::string name;
        std::string fullPath;
        uint64_t size = 0;
        int64_t mtime = 0;
        bool isDir = false;
    };

    struct ResultBatch {
        QString driveId;
        quint64 generationId = 0;
        quint32 sequence = 0; // per drive, starting at 0
        std::vector<SearchHit> hits;
    };

    struct DriveSearchReport {
        enum class Outcome : quint8 {
            Searched,
            SkippedNotReady, // all-drives scope, drive has no index yet
            NotReady,        // explicitly requested drive has no index yet
            Unknown,
        };

        QString driveId;
        Outcome outcome = Outcome::Searched;
        quint64 emitted = 0;
        quint64 matched = 0;
        bool truncated = false;
    };

    struct SearchCompletion {
        enum class Status : quint8 { Completed, NotReady, UnknownDrive };

        Status status = Status::Completed;
        quint64 totalCount = 0;   // hits emitted over all drives
        quint64 totalMatches = 0; // before the per-drive cap
        bool truncated = false;
        qint64 elapsedMs = 0;
        std::vector<DriveSearchReport> drives;
    };

    struct SearchEvent {
        enum class Kind : quint8 { Batch, Completed };

        Kind kind = Kind::Batch;
        ResultBatch batch;
        SearchCompletion completion;
    };

    struct SearchSettings {
        int batchSize = 200;
        int maxResultsPerDrive = 1000;
        int channelCapacity = 8;
        MatchScope matchScope = MatchScope::NameOrPath;
        int queryCacheSize = 64;
    };

    /**
     * Per-record test of a single atom. Literal atoms use substring containment,
     * wildcard atoms the WildcardMatcher; both on the lowercase keys of the store.
     */
    class AtomPredicate {
    public:
        AtomPredicate(const QueryCompiler::Atom& atom, MatchScope scope);

        [[nodiscard]] bool matches(const DriveStore& store, quint32 id) const;

        // Verified matches using the store's indices.
        [[nodiscard]] std::vector<quint32> allMatches(const DriveStore& store) const;

        // True if allMatches() can answer from the trigram index alone.
        [[nodiscard]] bool isIndexed() const;

    private:
        QueryCompiler::Atom m_atom;
        MatchScope m_scope;
        std::optional<WildcardMatcher> m_matcher;
    };

    namespace SearchExecutor {
        /**
         * Tests one record against the filter clauses.
         *
         * @param now Unix seconds used to resolve relative dates.
         */
        [[nodiscard]] bool passesFilters(const DriveStore& store, quint32 id,
                                         const QueryCompiler::FilterSet& filters, int64_t now);

        /**
         * All live records matching the query, ascending ids, without any cap.
         */
        [[nodiscard]] std::vector<quint32> evaluate(const DriveStore& store, const QueryCompiler::Query& query,
                                                    MatchScope scope, int64_t now);

        using BatchSink = std::function<bool(ResultBatch&& batch)>;

        struct ExecutionResult {
            quint64 emitted = 0;
            quint64 matched = 0;
            bool truncated = false;
            bool cancelled = false;
        };

        /**
         * Evaluates the query against one generation and hands the hits to the sink
         * in batches of at most settings.batchSize, capped at maxResultsPerDrive.
         * The cancellation flag is checked before every batch; the sink returning
         * false also stops the run.
         */
        ExecutionResult execute(const QString& driveId, const DriveStore& store,
                                const QueryCompiler::Query& query, const SearchSettings& settings,
                                int64_t now, const BatchSink& sink,
                                const std::atomic_bool* cancelled = nullptr);
    }
}

#endif //FINDEX_SEARCHEXECUTOR_H
