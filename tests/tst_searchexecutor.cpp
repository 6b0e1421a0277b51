// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <set>

#include <QDate>
#include <QDateTime>
#include <QRandomGenerator>
#include <QtTest>

#include "QueryCompiler.h"
#include "SearchExecutor.h"

using namespace IndexEngine;

namespace {
    constexpr uint64_t kMb = 1024ULL * 1024ULL;

    RawEntry entry(const std::string& path, uint64_t size = 0, int64_t mtime = 0, bool isDir = false,
                   quint8 attributes = 0) {
        RawEntry e;
        e.fullPath = path;
        e.name = path.substr(path.find_last_of('/') + 1);
        e.size = size;
        e.mtime = mtime;
        e.isDir = isDir;
        e.attributes = attributes;
        return e;
    }

    int64_t dayAt(int y, int m, int d) {
        return QDateTime(QDate(y, m, d), QTime(12, 0)).toSecsSinceEpoch();
    }

    std::set<std::string> names(const DriveStore& store, const std::vector<quint32>& ids) {
        std::set<std::string> out;
        for (const quint32 id : ids) out.insert(store.record(id).name);
        return out;
    }

    std::set<std::string> run(const DriveStore& store, const QString& query,
                              MatchScope scope = MatchScope::NameOrPath) {
        const int64_t now = QDateTime::currentSecsSinceEpoch();
        return names(store, SearchExecutor::evaluate(store, QueryCompiler::compile(query), scope, now));
    }
}

class TestSearchExecutor : public QObject {
    Q_OBJECT

private slots:
    void extensionAndSize();
    void projectNotBackup();
    void explicitDateRange();
    void singleCharacterWildcard();
    void orGroupsAndAnd();
    void sizePropertiesHold();
    void filtersOnly();
    void fileAndFolderKinds();
    void attributesAndPath();
    void pathLength();
    void nameOnlyScope();
    void removedRecordsAreNeverReturned();
    void capsAndBatches();
    void cancelledBeforeStart();
    void sinkCanStopTheRun();
};

void TestSearchExecutor::extensionAndSize() {
    DriveStore store;
    store.append(entry("/pics/photo.jpg", 6 * kMb));
    store.append(entry("/pics/icon.png", 2 * kMb));
    store.append(entry("/pics/notes.txt", 6 * kMb));

    QCOMPARE(run(store, QStringLiteral("ext:jpg|png size:>5mb")), std::set<std::string>{"photo.jpg"});
}

void TestSearchExecutor::projectNotBackup() {
    DriveStore store;
    store.append(entry("/docs/project_report.doc"));
    store.append(entry("/docs/project_backup.doc"));
    store.append(entry("/docs/unrelated.doc"));

    QCOMPARE(run(store, QStringLiteral("project !backup")), std::set<std::string>{"project_report.doc"});
}

void TestSearchExecutor::explicitDateRange() {
    DriveStore store;
    store.append(entry("/d/november.txt", 1, dayAt(2024, 11, 30)));
    store.append(entry("/d/december.txt", 1, dayAt(2024, 12, 10)));

    QCOMPARE(run(store, QStringLiteral("dm:2024-12-01..2024-12-22")), std::set<std::string>{"december.txt"});
}

void TestSearchExecutor::singleCharacterWildcard() {
    DriveStore store;
    store.append(entry("/t/test1.txt"));
    store.append(entry("/t/test22.txt"));
    store.append(entry("/t/testA.txt"));

    QCOMPARE(run(store, QStringLiteral("test?.txt")), (std::set<std::string>{"test1.txt", "testA.txt"}));
}

void TestSearchExecutor::orGroupsAndAnd() {
    DriveStore store;
    store.append(entry("/w/alpha_one.txt"));
    store.append(entry("/w/beta_one.txt"));
    store.append(entry("/w/gamma_one.txt"));
    store.append(entry("/w/alpha_two.txt"));

    QCOMPARE(run(store, QStringLiteral("alpha|beta one")), (std::set<std::string>{"alpha_one.txt", "beta_one.txt"}));
    QCOMPARE(run(store, QStringLiteral("a|zz _t")), std::set<std::string>{"alpha_two.txt"});
    QCOMPARE(run(store, QStringLiteral("one !*a_one*")), std::set<std::string>{});
    QCOMPARE(run(store, QStringLiteral("one !gam")), (std::set<std::string>{"alpha_one.txt", "beta_one.txt"}));
}

void TestSearchExecutor::sizePropertiesHold() {
    QRandomGenerator rng(42);
    DriveStore store;
    for (int i = 0; i < 2000; ++i) {
        store.append(entry("/r/file" + std::to_string(i) + ".bin", rng.bounded(4 * 1024 * 1024)));
    }

    const int64_t now = QDateTime::currentSecsSinceEpoch();

    const uint64_t n = 1024 * 1024;
    const auto above = SearchExecutor::evaluate(store, QueryCompiler::compile(QStringLiteral("size:>1mb")),
                                                MatchScope::NameOrPath, now);
    QVERIFY(!above.empty());
    for (const quint32 id : above) QVERIFY(store.record(id).size > n);

    const auto within = SearchExecutor::evaluate(store, QueryCompiler::compile(QStringLiteral("file size:1kb..2mb")),
                                                 MatchScope::NameOrPath, now);
    QVERIFY(!within.empty());
    for (const quint32 id : within) {
        QVERIFY(store.record(id).size >= 1024);
        QVERIFY(store.record(id).size <= 2 * n);
    }
}

void TestSearchExecutor::filtersOnly() {
    DriveStore store;
    store.append(entry("/m/a.mp3"));
    store.append(entry("/m/b.MP3"));
    store.append(entry("/m/c.flac"));
    store.append(entry("/m/mp3", 0, 0, true));

    QCOMPARE(run(store, QStringLiteral("ext:mp3")), (std::set<std::string>{"a.mp3", "b.MP3"}));
    QCOMPARE(run(store, QString()).size(), size_t(4));
}

void TestSearchExecutor::fileAndFolderKinds() {
    DriveStore store;
    store.append(entry("/k/reports", 0, 0, true));
    store.append(entry("/k/reports.txt"));

    QCOMPARE(run(store, QStringLiteral("folder:report")), std::set<std::string>{"reports"});
    QCOMPARE(run(store, QStringLiteral("file:report")), std::set<std::string>{"reports.txt"});
}

void TestSearchExecutor::attributesAndPath() {
    DriveStore store;
    store.append(entry("/home/me/.bashrc", 1, 0, false, AttrHidden));
    store.append(entry("/home/me/locked.txt", 1, 0, false, AttrHidden | AttrReadOnly));
    store.append(entry("/srv/other.txt", 1));

    QCOMPARE(run(store, QStringLiteral("attrib:h")), (std::set<std::string>{".bashrc", "locked.txt"}));
    QCOMPARE(run(store, QStringLiteral("attrib:hr")), std::set<std::string>{"locked.txt"});
    QCOMPARE(run(store, QStringLiteral("path:/SRV/")), std::set<std::string>{"other.txt"});
}

void TestSearchExecutor::pathLength() {
    DriveStore store;
    store.append(entry("/a/bc"));                          // 5
    store.append(entry("/a/" + std::string(40, 'x')));     // 43

    QCOMPARE(run(store, QStringLiteral("len:>10")).size(), size_t(1));
    QCOMPARE(run(store, QStringLiteral("len:5")), std::set<std::string>{"bc"});
}

void TestSearchExecutor::nameOnlyScope() {
    DriveStore store;
    store.append(entry("/projects/readme.md"));
    store.append(entry("/misc/projects.md"));

    QCOMPARE(run(store, QStringLiteral("projects"), MatchScope::NameOrPath).size(), size_t(2));
    QCOMPARE(run(store, QStringLiteral("projects"), MatchScope::NameOnly), std::set<std::string>{"projects.md"});
}

void TestSearchExecutor::removedRecordsAreNeverReturned() {
    DriveStore store;
    const quint32 id = store.append(entry("/x/keyword.txt"));
    store.append(entry("/x/other.txt"));
    QVERIFY(store.remove(id));

    QVERIFY(run(store, QStringLiteral("keyword")).empty());
    QVERIFY(run(store, QStringLiteral("k*")).empty());
    QCOMPARE(run(store, QString()), std::set<std::string>{"other.txt"});
}

void TestSearchExecutor::capsAndBatches() {
    DriveStore store;
    store.generationId = 7;
    for (int i = 0; i < 10; ++i) store.append(entry("/c/item" + std::to_string(i)));

    SearchSettings settings;
    settings.batchSize = 2;
    settings.maxResultsPerDrive = 5;

    std::vector<ResultBatch> batches;
    const auto r = SearchExecutor::execute(QStringLiteral("d1"), store, QueryCompiler::compile(QStringLiteral("item")),
                                           settings, 0, [&](ResultBatch&& b) {
                                               batches.push_back(std::move(b));
                                               return true;
                                           });

    QCOMPARE(r.emitted, quint64(5));
    QCOMPARE(r.matched, quint64(10));
    QVERIFY(r.truncated);
    QVERIFY(!r.cancelled);

    QCOMPARE(batches.size(), size_t(3));
    QCOMPARE(batches[0].hits.size(), size_t(2));
    QCOMPARE(batches[2].hits.size(), size_t(1));
    for (quint32 i = 0; i < batches.size(); ++i) {
        QCOMPARE(batches[i].sequence, i);
        QCOMPARE(batches[i].driveId, QStringLiteral("d1"));
        QCOMPARE(batches[i].generationId, quint64(7));
    }

    // Insertion order within the drive
    QCOMPARE(batches[0].hits[0].name, std::string("item0"));
    QCOMPARE(batches[2].hits[0].name, std::string("item4"));
    QCOMPARE(batches[2].hits[0].fullPath, std::string("/c/item4"));
}

void TestSearchExecutor::cancelledBeforeStart() {
    DriveStore store;
    store.append(entry("/c/a"));

    std::atomic_bool cancelled{true};
    int calls = 0;
    const auto r = SearchExecutor::execute(QStringLiteral("d"), store, QueryCompiler::compile(QString()), SearchSettings{},
                                           0, [&](ResultBatch&&) { ++calls; return true; }, &cancelled);
    QVERIFY(r.cancelled);
    QCOMPARE(calls, 0);
    QCOMPARE(r.emitted, quint64(0));
}

void TestSearchExecutor::sinkCanStopTheRun() {
    DriveStore store;
    for (int i = 0; i < 6; ++i) store.append(entry("/s/f" + std::to_string(i)));

    SearchSettings settings;
    settings.batchSize = 2;

    int calls = 0;
    const auto r = SearchExecutor::execute(QStringLiteral("d"), store, QueryCompiler::compile(QString()), settings, 0,
                                           [&](ResultBatch&&) { return ++calls < 2; });
    QVERIFY(r.cancelled);
    QCOMPARE(calls, 2);
    QCOMPARE(r.emitted, quint64(2));
}

QTEST_MAIN(TestSearchExecutor)
#include "tst_searchexecutor.moc"
