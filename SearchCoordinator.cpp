// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>

#include <QDateTime>
#include <QMutexLocker>

#include "Logging.h"
#include "SearchCoordinator.h"

namespace IndexEngine {
    SearchStream::SearchStream(std::shared_ptr<SearchSession> session)
        : m_session(std::move(session)) {
    }

    SearchStream::~SearchStream() {
        cancel();
    }

    SearchStream& SearchStream::operator=(SearchStream&& other) noexcept {
        if (this != &other) {
            cancel();
            m_session = std::move(other.m_session);
        }
        return *this;
    }

    std::optional<SearchEvent> SearchStream::next() {
        if (!m_session) return std::nullopt;
        return m_session->channel.pop();
    }

    void SearchStream::cancel() {
        if (m_session) {
            m_session->cancel();
        }
    }

    bool SearchStream::isCancelled() const {
        return !m_session || m_session->cancelled.load(std::memory_order_acquire);
    }

    SearchCoordinator::SearchCoordinator(const DriveRegistry& registry, QThreadPool* pool, SearchSettings settings)
        : m_registry(registry)
        , m_pool(pool)
        , m_settings(settings) {
        m_queryCache.setMaxCost(std::max(m_settings.queryCacheSize, 0));
    }

    SearchCoordinator::~SearchCoordinator() {
        {
            QMutexLocker lock(&m_mutex);
            for (auto& kv : m_sessions) {
                if (auto s = kv.second.lock()) s->cancel();
            }
            m_sessions.clear();
        }
        // Drive tasks capture 'this'
        m_pool->waitForDone();
    }

    QueryCompiler::Query SearchCoordinator::compile(const QString& rawQuery) {
        QMutexLocker lock(&m_mutex);
        if (const QueryCompiler::Query* cached = m_queryCache.object(rawQuery)) {
            return *cached;
        }
        lock.unlock();

        QueryCompiler::Query q = QueryCompiler::compile(rawQuery);
        qCDebug(lcQuery) << "Compiled" << rawQuery << "->" << QueryCompiler::describe(q);

        if (m_settings.queryCacheSize > 0) {
            lock.relock();
            m_queryCache.insert(rawQuery, new QueryCompiler::Query(q));
        }
        return q;
    }

    SearchStream SearchCoordinator::compileAndSearch(const QString& rawQuery, const DriveScope& scope,
                                                     const QString& sessionKey) {
        return search(compile(rawQuery), scope, sessionKey);
    }

    bool SearchCoordinator::cancelSession(const QString& sessionKey) {
        QMutexLocker lock(&m_mutex);
        const auto it = m_sessions.find(sessionKey);
        if (it == m_sessions.end()) return false;

        const std::shared_ptr<SearchSession> s = it->second.lock();
        m_sessions.erase(it);
        if (!s) return false;

        s->cancel();
        return true;
    }

    SearchStream SearchCoordinator::search(const QueryCompiler::Query& query, const DriveScope& scope,
                                           const QString& sessionKey) {
        const quint64 searchId = m_nextSearchId.fetch_add(1);
        auto session = std::make_shared<SearchSession>(searchId, sessionKey,
                                                       static_cast<size_t>(std::max(m_settings.channelCapacity, 1)));
        session->startedMs = QDateTime::currentMSecsSinceEpoch();
        const int64_t now = QDateTime::currentSecsSinceEpoch();

        if (!sessionKey.isEmpty()) {
            QMutexLocker lock(&m_mutex);

            // Drop sessions nobody holds anymore
            for (auto it = m_sessions.begin(); it != m_sessions.end();) {
                if (it->second.expired()) it = m_sessions.erase(it);
                else ++it;
            }

            if (const auto previous = m_sessions[sessionKey].lock()) {
                qCDebug(lcSearch) << "Search" << previous->id << "superseded by" << searchId;
                previous->cancel();
            }
            m_sessions[sessionKey] = session;
        }

        SearchStream stream(session);

        struct Target {
            QString driveId;
            Generation generation;
        };
        std::vector<Target> targets;
        SearchCompletion base;

        if (!scope.allDrives) {
            const std::optional<DriveEntry> e = m_registry.entry(scope.driveId);
            if (!e) {
                base.status = SearchCompletion::Status::UnknownDrive;
                base.drives.push_back(DriveSearchReport{scope.driveId, DriveSearchReport::Outcome::Unknown});
                complete(session, std::move(base));
                return stream;
            }
            if (!e->generation) {
                base.status = SearchCompletion::Status::NotReady;
                base.drives.push_back(DriveSearchReport{scope.driveId, DriveSearchReport::Outcome::NotReady});
                complete(session, std::move(base));
                return stream;
            }
            targets.push_back(Target{e->info.id, e->generation});
        } else {
            for (const DriveEntry& e : m_registry.entries()) {
                if (e.generation) {
                    targets.push_back(Target{e.info.id, e.generation});
                } else {
                    base.drives.push_back(DriveSearchReport{e.info.id, DriveSearchReport::Outcome::SkippedNotReady});
                }
            }
        }

        qCInfo(lcSearch) << "Search" << searchId << QueryCompiler::describe(query) << "over" << targets.size() << "drive(s)";

        if (targets.empty()) {
            complete(session, std::move(base));
            return stream;
        }

        {
            QMutexLocker lock(&session->mutex);
            session->completion = std::move(base);
            session->remainingDrives = static_cast<int>(targets.size());
        }

        for (const Target& t : targets) {
            m_pool->start([this, session, t, query, now]() {
                runDrive(session, t.driveId, t.generation, query, now);
            });
        }

        return stream;
    }

    void SearchCoordinator::runDrive(const std::shared_ptr<SearchSession>& session, const QString& driveId,
                                     const Generation& generation, const QueryCompiler::Query& query, int64_t now) {
        const SearchExecutor::ExecutionResult r = SearchExecutor::execute(
            driveId, *generation, query, m_settings, now,
            [&session](ResultBatch&& batch) {
                SearchEvent ev;
                ev.kind = SearchEvent::Kind::Batch;
                ev.batch = std::move(batch);
                return session->channel.push(std::move(ev));
            },
            &session->cancelled);

        DriveSearchReport report;
        report.driveId = driveId;
        report.outcome = DriveSearchReport::Outcome::Searched;
        report.emitted = r.emitted;
        report.matched = r.matched;
        report.truncated = r.truncated;
        finishDrive(session, report);
    }

    void SearchCoordinator::finishDrive(const std::shared_ptr<SearchSession>& session, const DriveSearchReport& report) {
        SearchCompletion completion;
        {
            QMutexLocker lock(&session->mutex);
            SearchCompletion& c = session->completion;
            c.drives.push_back(report);
            c.totalCount += report.emitted;
            c.totalMatches += report.matched;
            c.truncated = c.truncated || report.truncated;

            if (--session->remainingDrives > 0) return;
            completion = std::move(c);
        }

        complete(session, std::move(completion));
    }

    void SearchCoordinator::complete(const std::shared_ptr<SearchSession>& session, SearchCompletion completion) {
        if (!session->cancelled.load(std::memory_order_acquire)) {
            std::sort(completion.drives.begin(), completion.drives.end(),
                      [](const DriveSearchReport& a, const DriveSearchReport& b) { return a.driveId < b.driveId; });
            completion.elapsedMs = QDateTime::currentMSecsSinceEpoch() - session->startedMs;

            qCDebug(lcSearch) << "Search" << session->id << "completed:" << completion.totalCount << "of"
                              << completion.totalMatches << "in" << completion.elapsedMs << "ms";

            SearchEvent ev;
            ev.kind = SearchEvent::Kind::Completed;
            ev.completion = std::move(completion);
            if (!session->channel.push(std::move(ev))) {
                qCDebug(lcSearch) << "Search" << session->id << "closed before completion";
            }
        }
        session->channel.finish();
    }
}
