// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QRandomGenerator>
#include <QtTest>

#include "DriveStore.h"

using namespace IndexEngine;

namespace {
    RawEntry fileEntry(const std::string& dir, const std::string& name, uint64_t size = 0, int64_t mtime = 0) {
        RawEntry e;
        e.name = name;
        e.fullPath = dir + "/" + name;
        e.size = size;
        e.mtime = mtime;
        return e;
    }

    RawEntry dirEntry(const std::string& parent, const std::string& name) {
        RawEntry e = fileEntry(parent, name);
        e.isDir = true;
        return e;
    }

    // Deterministic corpus of mixed-case names in a handful of directories.
    DriveStore makeCorpus(int count) {
        static const char* const words[] = {"Report", "photo", "Notes", "backup", "projekt", "übersicht",
                                            "data", "rep", "ort", "Repo", "ä", "x"};
        static const char* const dirs[] = {"/home/me", "/home/me/Reports", "/srv/Backup/old", "/data"};
        static const char* const exts[] = {".txt", ".JPG", ".tar.gz", "", ".doc"};

        QRandomGenerator rng(1234);
        DriveStore store;
        for (int i = 0; i < count; ++i) {
            std::string name = words[rng.bounded(12)];
            name += "_";
            name += words[rng.bounded(12)];
            name += std::to_string(rng.bounded(100));
            name += exts[rng.bounded(5)];
            store.append(fileEntry(dirs[rng.bounded(4)], name, rng.bounded(1u << 20)));
        }
        return store;
    }
}

class TestDriveStore : public QObject {
    Q_OBJECT

private slots:
    void appendDerivesKeys();
    void trigramMatchesEqualExhaustiveScan_data();
    void trigramMatchesEqualExhaustiveScan();
    void nameOnlyIgnoresDirectories();
    void shortLiteralsScan();
    void wildcardMatches();
    void removePurgesEveryIndex();
    void addThenRemoveRestoresResults();
    void findByPath();
    void copyIsIndependent();
    void stats();
};

void TestDriveStore::appendDerivesKeys() {
    DriveStore store;
    const quint32 a = store.append(fileEntry("/Home/Me", "Photo.JPG", 10));
    const quint32 b = store.append(dirEntry("/Home/Me", "Pictures.d"));

    QCOMPARE(a, quint32(0));
    QCOMPARE(b, quint32(1));
    QCOMPARE(store.record(a).extension, std::string("jpg"));
    QVERIFY(store.record(b).extension.empty());
    QCOMPARE(store.record(b).size, uint64_t(0));
    QCOMPARE(store.lowerName(a), std::string_view("photo.jpg"));
    QCOMPARE(store.lowerPath(a), std::string_view("/home/me/photo.jpg"));
    QCOMPARE(store.pathLength(a), quint32(18));
    QCOMPARE(store.idsWithExtension("jpg"), std::vector<quint32>{a});
    QVERIFY(store.idsWithExtension("d").empty());
}

void TestDriveStore::trigramMatchesEqualExhaustiveScan_data() {
    QTest::addColumn<QString>("literal");

    for (const char* lit : {"rep", "report", "ort_", "übersicht", "ersi", "backup", "_no", "repo_",
                            "me/rep", "/srv/", "tar.gz", "zzz", "ä_ä", "s/old"}) {
        QTest::newRow(lit) << QString::fromUtf8(lit);
    }
}

void TestDriveStore::trigramMatchesEqualExhaustiveScan() {
    QFETCH(QString, literal);
    const std::string lit = literal.toLower().toStdString();

    static const DriveStore store = makeCorpus(5000);

    QCOMPARE(store.matchLiteral(lit, MatchScope::NameOnly), store.exhaustiveScan(lit, MatchScope::NameOnly));
    QCOMPARE(store.matchLiteral(lit, MatchScope::NameOrPath), store.exhaustiveScan(lit, MatchScope::NameOrPath));
}

void TestDriveStore::nameOnlyIgnoresDirectories() {
    DriveStore store;
    const quint32 inReports = store.append(fileEntry("/home/reports", "a.txt"));
    const quint32 named = store.append(fileEntry("/home/other", "reports.txt"));

    QCOMPARE(store.matchLiteral("reports", MatchScope::NameOnly), std::vector<quint32>{named});
    QCOMPARE(store.matchLiteral("reports", MatchScope::NameOrPath), (std::vector<quint32>{inReports, named}));
}

void TestDriveStore::shortLiteralsScan() {
    DriveStore store;
    store.append(fileEntry("/a", "ab.txt"));
    store.append(fileEntry("/a", "cd.txt"));
    const quint32 third = store.append(fileEntry("/a", "xAB"));

    QCOMPARE(store.matchLiteral("ab", MatchScope::NameOnly), (std::vector<quint32>{0, third}));
    QVERIFY(store.trigramCandidates("ab").empty());
    QCOMPARE(store.matchLiteral("", MatchScope::NameOnly).size(), size_t(3));
}

void TestDriveStore::wildcardMatches() {
    DriveStore store;
    const quint32 t1 = store.append(fileEntry("/t", "test1.txt"));
    store.append(fileEntry("/t", "test22.txt"));
    const quint32 ta = store.append(fileEntry("/t", "testA.txt"));
    const quint32 deep = store.append(fileEntry("/t/docs", "x.txt"));

    QCOMPARE(store.matchWildcard("test?.txt"), (std::vector<quint32>{t1, ta}));
    QCOMPARE(store.matchWildcard("*/docs/*.txt"), std::vector<quint32>{deep});
}

void TestDriveStore::removePurgesEveryIndex() {
    DriveStore store;
    const quint32 keep = store.append(fileEntry("/p", "photo.jpg"));
    const quint32 gone = store.append(fileEntry("/p", "photo2.jpg"));

    // "photo2.jpg" adds to2, o2. and 2.j to the seven trigrams of "photo.jpg"
    QCOMPARE(store.trigramBucketCount(), size_t(10));

    QVERIFY(store.remove(gone));
    QCOMPARE(store.trigramBucketCount(), size_t(7));
    QVERIFY(!store.remove(gone));
    QVERIFY(!store.remove(99));

    QVERIFY(!store.isLive(gone));
    QCOMPARE(store.liveCount(), size_t(1));
    QCOMPARE(store.slotCount(), size_t(2));
    QCOMPARE(store.idsWithExtension("jpg"), std::vector<quint32>{keep});
    QVERIFY(store.idsWithName("photo2.jpg").empty());
    QCOMPARE(store.trigramCandidates("photo"), std::vector<quint32>{keep});
    QCOMPARE(store.matchLiteral("/p/", MatchScope::NameOrPath), std::vector<quint32>{keep});
    QCOMPARE(store.liveIds(), std::vector<quint32>{keep});

    QVERIFY(store.remove(keep));
    QCOMPARE(store.trigramBucketCount(), size_t(0));
}

void TestDriveStore::addThenRemoveRestoresResults() {
    DriveStore store = makeCorpus(500);
    const std::vector<std::string> needles = {"rep", "photo", "x", "/home/me", "übersicht"};

    std::vector<std::vector<quint32>> before;
    for (const std::string& p : needles) before.push_back(store.matchLiteral(p, MatchScope::NameOrPath));
    const std::vector<quint32> jpgBefore = store.idsWithExtension("jpg");

    const quint32 id = store.append(fileEntry("/home/me", "Report_photo_übersicht.JPG", 5));
    QVERIFY(store.remove(id));

    for (size_t i = 0; i < needles.size(); ++i) {
        QCOMPARE(store.matchLiteral(needles[i], MatchScope::NameOrPath), before[i]);
    }
    QCOMPARE(store.idsWithExtension("jpg"), jpgBefore);
}

void TestDriveStore::findByPath() {
    DriveStore store;
    store.append(fileEntry("/a", "same.txt"));
    const quint32 b = store.append(fileEntry("/b", "same.txt"));

    QCOMPARE(store.findByPath("/b/same.txt"), std::optional<quint32>(b));
    QVERIFY(!store.findByPath("/B/same.txt"));
    QVERIFY(!store.findByPath("/c/same.txt"));
    QVERIFY(!store.findByPath("/b/"));

    QVERIFY(store.remove(b));
    QVERIFY(!store.findByPath("/b/same.txt"));
}

void TestDriveStore::copyIsIndependent() {
    DriveStore original;
    original.append(fileEntry("/x", "alpha.txt"));

    DriveStore copy = original;
    copy.append(fileEntry("/x", "alphabet.txt"));
    QVERIFY(copy.remove(0));

    QCOMPARE(original.liveCount(), size_t(1));
    QCOMPARE(original.matchLiteral("alpha", MatchScope::NameOnly), std::vector<quint32>{0});
    QCOMPARE(copy.matchLiteral("alpha", MatchScope::NameOnly), std::vector<quint32>{1});
}

void TestDriveStore::stats() {
    DriveStore store;
    store.append(fileEntry("/s", "a.bin", 100));
    store.append(fileEntry("/s", "b.bin", 50));
    store.append(dirEntry("/s", "sub"));
    QVERIFY(store.remove(1));

    const StoreStats s = store.stats();
    QCOMPARE(s.liveRecords, quint64(2));
    QCOMPARE(s.directories, quint64(1));
    QCOMPARE(s.totalBytes, quint64(100));
}

QTEST_MAIN(TestDriveStore)
#include "tst_drivestore.moc"
