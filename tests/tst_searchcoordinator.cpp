// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <map>
#include <set>

#include <QThreadPool>
#include <QtTest>

#include "SearchCoordinator.h"

using namespace IndexEngine;
using Status = SearchCompletion::Status;
using Outcome = DriveSearchReport::Outcome;

namespace {
    struct Collected {
        std::vector<ResultBatch> batches;
        std::optional<SearchCompletion> completion;
        int completions = 0;
        bool batchAfterCompletion = false;

        [[nodiscard]] std::set<std::string> paths() const {
            std::set<std::string> out;
            for (const ResultBatch& b : batches) {
                for (const SearchHit& h : b.hits) out.insert(h.fullPath);
            }
            return out;
        }
    };

    Collected drain(SearchStream& stream) {
        Collected c;
        while (std::optional<SearchEvent> ev = stream.next()) {
            if (ev->kind == SearchEvent::Kind::Batch) {
                if (c.completions > 0) c.batchAfterCompletion = true;
                c.batches.push_back(std::move(ev->batch));
            } else {
                ++c.completions;
                c.completion = std::move(ev->completion);
            }
        }
        return c;
    }

    std::shared_ptr<DriveStore> storeOf(const std::string& root, int count, const std::string& stem = "file") {
        auto store = std::make_shared<DriveStore>();
        for (int i = 0; i < count; ++i) {
            RawEntry e;
            e.name = stem + std::to_string(i) + ".txt";
            e.fullPath = root + "/" + e.name;
            store->append(std::move(e));
        }
        return store;
    }
}

class TestSearchCoordinator : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void mergesAllReadyDrives();
    void allDrivesSkipsNotReady();
    void explicitDriveNotReady();
    void unknownDrive();
    void perDriveOrderAndCap();
    void backpressureLosesNothing();
    void newSearchSupersedesSameSession();
    void otherSessionsAreIndependent();
    void cancelSessionEndsStream();
    void droppingStreamCancels();
    void searchKeepsItsGeneration();
    void compileIsCached();

private:
    void publish(const QString& id, std::shared_ptr<DriveStore> store);
    std::unique_ptr<SearchCoordinator> makeCoordinator(int batchSize, int cap, int capacity);

    std::unique_ptr<QThreadPool> m_pool;
    std::unique_ptr<DriveRegistry> m_registry;
};

void TestSearchCoordinator::init() {
    m_pool = std::make_unique<QThreadPool>();
    m_pool->setMaxThreadCount(4);
    m_registry = std::make_unique<DriveRegistry>();

    for (const char* id : {"a", "b", "c"}) {
        DriveInfo d;
        d.id = QString::fromLatin1(id);
        d.rootPath = QStringLiteral("/") + d.id;
        QVERIFY(m_registry->addDrive(d));
    }
    publish(QStringLiteral("a"), storeOf("/a", 5));
    publish(QStringLiteral("b"), storeOf("/b", 3));
    // c stays NotBuilt
}

void TestSearchCoordinator::cleanup() {
    m_pool->waitForDone();
    m_registry.reset();
    m_pool.reset();
}

void TestSearchCoordinator::publish(const QString& id, std::shared_ptr<DriveStore> store) {
    const std::optional<IndexState> st = m_registry->state(id);
    QVERIFY(st);
    if (st->kind != IndexState::Kind::Building) {
        QVERIFY(m_registry->beginBuild(id));
    }
    QVERIFY(m_registry->completeBuild(id, std::move(store)));
}

std::unique_ptr<SearchCoordinator> TestSearchCoordinator::makeCoordinator(int batchSize, int cap, int capacity) {
    SearchSettings s;
    s.batchSize = batchSize;
    s.maxResultsPerDrive = cap;
    s.channelCapacity = capacity;
    return std::make_unique<SearchCoordinator>(*m_registry, m_pool.get(), s);
}

void TestSearchCoordinator::mergesAllReadyDrives() {
    auto coord = makeCoordinator(2, 1000, 8);
    SearchStream stream = coord->compileAndSearch(QStringLiteral("file"), DriveScope::all());
    QVERIFY(stream.searchId() != 0);

    const Collected c = drain(stream);
    QCOMPARE(c.completions, 1);
    QVERIFY(!c.batchAfterCompletion);
    QCOMPARE(c.paths().size(), size_t(8));

    const SearchCompletion& done = *c.completion;
    QCOMPARE(done.status, Status::Completed);
    QCOMPARE(done.totalCount, quint64(8));
    QCOMPARE(done.totalMatches, quint64(8));
    QVERIFY(!done.truncated);
    QCOMPARE(done.drives.size(), size_t(3));
    QCOMPARE(done.drives[0].driveId, QStringLiteral("a"));
    QCOMPARE(done.drives[0].outcome, Outcome::Searched);
    QCOMPARE(done.drives[0].emitted, quint64(5));
    QCOMPARE(done.drives[1].emitted, quint64(3));
}

void TestSearchCoordinator::allDrivesSkipsNotReady() {
    auto coord = makeCoordinator(10, 1000, 8);
    SearchStream stream = coord->compileAndSearch(QString(), DriveScope::all());
    const Collected c = drain(stream);

    QCOMPARE(c.completion->status, Status::Completed);
    QCOMPARE(c.completion->drives[2].driveId, QStringLiteral("c"));
    QCOMPARE(c.completion->drives[2].outcome, Outcome::SkippedNotReady);
    QCOMPARE(c.completion->totalCount, quint64(8));
}

void TestSearchCoordinator::explicitDriveNotReady() {
    auto coord = makeCoordinator(10, 1000, 8);
    SearchStream stream = coord->compileAndSearch(QStringLiteral("file"), DriveScope::drive(QStringLiteral("c")));
    const Collected c = drain(stream);

    QVERIFY(c.batches.empty());
    QCOMPARE(c.completions, 1);
    QCOMPARE(c.completion->status, Status::NotReady);
    QCOMPARE(c.completion->drives.front().outcome, Outcome::NotReady);
}

void TestSearchCoordinator::unknownDrive() {
    auto coord = makeCoordinator(10, 1000, 8);
    SearchStream stream = coord->compileAndSearch(QStringLiteral("file"), DriveScope::drive(QStringLiteral("zz")));
    const Collected c = drain(stream);

    QVERIFY(c.batches.empty());
    QCOMPARE(c.completion->status, Status::UnknownDrive);
}

void TestSearchCoordinator::perDriveOrderAndCap() {
    publish(QStringLiteral("a"), storeOf("/a", 50));
    auto coord = makeCoordinator(7, 20, 2);

    SearchStream stream = coord->compileAndSearch(QStringLiteral("file"), DriveScope::drive(QStringLiteral("a")));
    const Collected c = drain(stream);

    quint32 expectedSeq = 0;
    quint32 lastId = 0;
    bool first = true;
    for (const ResultBatch& b : c.batches) {
        QCOMPARE(b.sequence, expectedSeq++);
        for (const SearchHit& h : b.hits) {
            if (!first) QVERIFY(h.recordId > lastId);
            lastId = h.recordId;
            first = false;
        }
    }
    QCOMPARE(c.batches.size(), size_t(3)); // 7 + 7 + 6
    QCOMPARE(c.completion->totalCount, quint64(20));
    QCOMPARE(c.completion->totalMatches, quint64(50));
    QVERIFY(c.completion->truncated);
}

void TestSearchCoordinator::backpressureLosesNothing() {
    publish(QStringLiteral("a"), storeOf("/a", 40));
    auto coord = makeCoordinator(1, 1000, 1);

    SearchStream stream = coord->compileAndSearch(QStringLiteral("file"), DriveScope::drive(QStringLiteral("a")));

    // The producer is now blocked on the full channel; nothing may be dropped meanwhile
    QTest::qWait(50);

    const Collected c = drain(stream);
    QCOMPARE(c.batches.size(), size_t(40));
    QCOMPARE(c.paths().size(), size_t(40));
    QCOMPARE(c.completions, 1);
}

void TestSearchCoordinator::newSearchSupersedesSameSession() {
    publish(QStringLiteral("a"), storeOf("/a", 100, "old"));
    publish(QStringLiteral("b"), storeOf("/b", 4, "new"));
    auto coord = makeCoordinator(1, 1000, 1);

    SearchStream first = coord->compileAndSearch(QStringLiteral("old"), DriveScope::all(), QStringLiteral("window-1"));
    SearchStream second = coord->compileAndSearch(QStringLiteral("new"), DriveScope::all(), QStringLiteral("window-1"));

    QVERIFY(first.isCancelled());
    QVERIFY(!second.isCancelled());

    const Collected old = drain(first);
    QCOMPARE(old.completions, 0);

    const Collected latest = drain(second);
    QCOMPARE(latest.completions, 1);
    QCOMPARE(latest.paths(), (std::set<std::string>{"/b/new0.txt", "/b/new1.txt", "/b/new2.txt", "/b/new3.txt"}));
    for (const ResultBatch& b : latest.batches) {
        QCOMPARE(b.driveId, QStringLiteral("b"));
    }
}

void TestSearchCoordinator::otherSessionsAreIndependent() {
    auto coord = makeCoordinator(10, 1000, 8);

    SearchStream one = coord->compileAndSearch(QStringLiteral("file"), DriveScope::all(), QStringLiteral("k1"));
    SearchStream two = coord->compileAndSearch(QStringLiteral("file"), DriveScope::all(), QStringLiteral("k2"));

    QCOMPARE(drain(one).completions, 1);
    QCOMPARE(drain(two).completions, 1);
}

void TestSearchCoordinator::cancelSessionEndsStream() {
    publish(QStringLiteral("a"), storeOf("/a", 100));
    auto coord = makeCoordinator(1, 1000, 1);

    SearchStream stream = coord->compileAndSearch(QStringLiteral("file"), DriveScope::all(), QStringLiteral("s"));
    QVERIFY(coord->cancelSession(QStringLiteral("s")));
    QVERIFY(!coord->cancelSession(QStringLiteral("s")));

    const Collected c = drain(stream);
    QCOMPARE(c.completions, 0);
    QVERIFY(stream.isCancelled());
}

void TestSearchCoordinator::droppingStreamCancels() {
    publish(QStringLiteral("a"), storeOf("/a", 1000));
    auto coord = makeCoordinator(1, 1000, 1);

    {
        SearchStream stream = coord->compileAndSearch(QStringLiteral("file"), DriveScope::all());
        QVERIFY(stream.next());
    }

    // Producers blocked on the full channel are released by the cancellation
    QVERIFY(m_pool->waitForDone(5000));
}

void TestSearchCoordinator::searchKeepsItsGeneration() {
    publish(QStringLiteral("a"), storeOf("/a", 10));
    const quint64 oldGen = m_registry->generation(QStringLiteral("a"))->generationId;
    auto coord = makeCoordinator(1, 1000, 1);

    SearchStream stream = coord->compileAndSearch(QStringLiteral("file"), DriveScope::drive(QStringLiteral("a")));
    QTest::qWait(20);

    // Rebuild while the search is still streaming the old generation
    publish(QStringLiteral("a"), storeOf("/a", 2));

    const Collected c = drain(stream);
    QCOMPARE(c.batches.size(), size_t(10));
    for (const ResultBatch& b : c.batches) {
        QCOMPARE(b.generationId, oldGen);
    }
}

void TestSearchCoordinator::compileIsCached() {
    auto coord = makeCoordinator(10, 1000, 8);
    const QueryCompiler::Query a = coord->compile(QStringLiteral("ext:jpg report"));
    const QueryCompiler::Query b = coord->compile(QStringLiteral("ext:jpg report"));
    QCOMPARE(a, b);
    QCOMPARE(a, QueryCompiler::compile(QStringLiteral("ext:jpg report")));
}

QTEST_MAIN(TestSearchCoordinator)
#include "tst_searchcoordinator.moc"
