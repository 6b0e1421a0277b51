// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_SEARCHCOORDINATOR_H
#define FINDEX_SEARCHCOORDINATOR_H

#include <atomic>
#include <map>
#include <memory>
#include <optional>

#include <QCache>
#include <QMutex>
#include <QString>
#include <QThreadPool>

#include "BatchChannel.h"
#include "DriveRegistry.h"
#include "QueryCompiler.h"
#include "SearchExecutor.h"

namespace IndexEngine {
    /**
     * State shared between a SearchStream and the drive tasks feeding it.
     */
    struct SearchSession {
        SearchSession(quint64 searchId, QString key, size_t capacity)
            : id(searchId), sessionKey(std::move(key)), channel(capacity) {
        }

        const quint64 id;
        const QString sessionKey;
        std::atomic_bool cancelled{false};
        BatchChannel<SearchEvent> channel;

        // Completion aggregation, guarded by mutex
        QMutex mutex;
        int remainingDrives = 0;
        SearchCompletion completion;
        qint64 startedMs = 0;

        void cancel() {
            cancelled.store(true, std::memory_order_release);
            channel.close();
        }
    };

    /**
     * Consumer side of one search: zero or more Batch events, then one Completed
     * event, unless the search is cancelled or superseded, in which case the
     * stream just ends.
     *
     * Destroying the stream cancels the search.
     */
    class SearchStream {
    public:
        SearchStream() = default;
        explicit SearchStream(std::shared_ptr<SearchSession> session);
        ~SearchStream();

        SearchStream(SearchStream&& other) noexcept = default;
        SearchStream& operator=(SearchStream&& other) noexcept;
        SearchStream(const SearchStream&) = delete;
        SearchStream& operator=(const SearchStream&) = delete;

        /**
         * Blocks until the next event is available.
         *
         * @return The event, or std::nullopt once the stream has ended.
         */
        [[nodiscard]] std::optional<SearchEvent> next();

        void cancel();

        [[nodiscard]] quint64 searchId() const { return m_session ? m_session->id : 0; }
        [[nodiscard]] bool isCancelled() const;

    private:
        std::shared_ptr<SearchSession> m_session;
    };

    /**
     * Runs a query over every drive in scope in parallel and merges the results
     * into one stream. Per drive, hits arrive in ascending record id order; batches
     * of different drives interleave in no particular order.
     *
     * A new search with the same non-empty session key supersedes the previous one.
     */
    class SearchCoordinator {
    public:
        SearchCoordinator(const DriveRegistry& registry, QThreadPool* pool, SearchSettings settings);
        ~SearchCoordinator();

        SearchCoordinator(const SearchCoordinator&) = delete;
        SearchCoordinator& operator=(const SearchCoordinator&) = delete;

        [[nodiscard]] SearchStream compileAndSearch(const QString& rawQuery, const DriveScope& scope,
                                                    const QString& sessionKey = {});

        [[nodiscard]] SearchStream search(const QueryCompiler::Query& query, const DriveScope& scope,
                                          const QString& sessionKey = {});

        // Compiles through the query cache.
        [[nodiscard]] QueryCompiler::Query compile(const QString& rawQuery);

        /**
         * Cancels the running search registered under this session key.
         *
         * @return false if there is none.
         */
        bool cancelSession(const QString& sessionKey);

        [[nodiscard]] const SearchSettings& settings() const { return m_settings; }

    private:
        void runDrive(const std::shared_ptr<SearchSession>& session, const QString& driveId,
                      const Generation& generation, const QueryCompiler::Query& query, int64_t now);
        void finishDrive(const std::shared_ptr<SearchSession>& session, const DriveSearchReport& report);
        static void complete(const std::shared_ptr<SearchSession>& session, SearchCompletion completion);

        const DriveRegistry& m_registry;
        QThreadPool* m_pool;
        SearchSettings m_settings;

        QMutex m_mutex; // guards m_sessions and m_queryCache
        std::map<QString, std::weak_ptr<SearchSession>> m_sessions;
        QCache<QString, QueryCompiler::Query> m_queryCache;
        std::atomic<quint64> m_nextSearchId{1};
    };
}

#endif //FINDEX_SEARCHCOORDINATOR_H
