// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <map>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QtTest>

#include "scanners/DirectoryWalker.h"

using namespace IndexEngine;

namespace {
    void touch(const QString& path, const QByteArray& content = {}) {
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(content);
    }

    std::map<QString, RawEntry> walkAll(Scanners::DirectoryWalker& walker, const QString& root, bool* okOut = nullptr) {
        DriveInfo drive;
        drive.id = QStringLiteral("t");
        drive.rootPath = root;

        std::map<QString, RawEntry> out;
        QString err;
        const bool ok = walker.walk(drive, [&](RawEntry&& e) {
            const QString rel = QDir(root).relativeFilePath(QString::fromStdString(e.fullPath));
            out.emplace(rel, std::move(e));
            return true;
        }, &err);
        if (okOut) *okOut = ok;
        return out;
    }
}

class TestDirectoryWalker : public QObject {
    Q_OBJECT

private slots:
    void init();

    void recordsFilesAndDirectories();
    void skipsListedDirectories();
    void skipsHiddenWhenAsked();
    void missingRootFails();
    void sinkCanAbort();
    void directoryVanishingMidWalkFails();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
};

void TestDirectoryWalker::init() {
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());

    const QDir root(m_dir->path());
    QVERIFY(root.mkpath(QStringLiteral("docs/deep")));
    QVERIFY(root.mkpath(QStringLiteral("node_modules/pkg")));
    QVERIFY(root.mkpath(QStringLiteral(".cache")));

    touch(root.filePath(QStringLiteral("readme.md")), "hello");
    touch(root.filePath(QStringLiteral("docs/deep/report.PDF")), QByteArray(1000, 'x'));
    touch(root.filePath(QStringLiteral("node_modules/pkg/index.js")));
    touch(root.filePath(QStringLiteral(".cache/blob")));
    touch(root.filePath(QStringLiteral(".hidden")));
}

void TestDirectoryWalker::recordsFilesAndDirectories() {
    Scanners::DirectoryWalker walker;
    bool ok = false;
    const auto entries = walkAll(walker, m_dir->path(), &ok);
    QVERIFY(ok);

    QVERIFY(!entries.contains(QStringLiteral(".")));
    QVERIFY(entries.contains(QStringLiteral("docs")));
    QVERIFY(entries.at(QStringLiteral("docs")).isDir);
    QCOMPARE(entries.at(QStringLiteral("docs")).size, uint64_t(0));

    const RawEntry& report = entries.at(QStringLiteral("docs/deep/report.PDF"));
    QCOMPARE(report.name, std::string("report.PDF"));
    QCOMPARE(report.size, uint64_t(1000));
    QVERIFY(!report.isDir);
    QVERIFY(report.mtime > 0);

    QVERIFY(entries.at(QStringLiteral(".hidden")).attributes & AttrHidden);
    QVERIFY(!(entries.at(QStringLiteral("readme.md")).attributes & AttrHidden));
    QVERIFY(entries.contains(QStringLiteral(".cache/blob")));
}

void TestDirectoryWalker::skipsListedDirectories() {
    Scanners::DirectoryWalker walker;
    const auto entries = walkAll(walker, m_dir->path());

    QVERIFY(!entries.contains(QStringLiteral("node_modules")));
    QVERIFY(!entries.contains(QStringLiteral("node_modules/pkg/index.js")));
    QVERIFY(walker.skippedCount() >= 1);

    Scanners::WalkOptions options;
    options.skipDirNames = {QStringLiteral("DOCS")};
    Scanners::DirectoryWalker custom(options);
    const auto customEntries = walkAll(custom, m_dir->path());
    QVERIFY(customEntries.contains(QStringLiteral("node_modules/pkg/index.js")));
    QVERIFY(!customEntries.contains(QStringLiteral("docs/deep/report.PDF")));
}

void TestDirectoryWalker::skipsHiddenWhenAsked() {
    Scanners::WalkOptions options;
    options.skipHidden = true;
    Scanners::DirectoryWalker walker(options);
    const auto entries = walkAll(walker, m_dir->path());

    QVERIFY(!entries.contains(QStringLiteral(".hidden")));
    QVERIFY(!entries.contains(QStringLiteral(".cache")));
    QVERIFY(!entries.contains(QStringLiteral(".cache/blob")));
    QVERIFY(entries.contains(QStringLiteral("readme.md")));
}

void TestDirectoryWalker::missingRootFails() {
    Scanners::DirectoryWalker walker;
    bool ok = true;
    const auto entries = walkAll(walker, m_dir->filePath(QStringLiteral("does-not-exist")), &ok);
    QVERIFY(!ok);
    QVERIFY(entries.empty());
}

void TestDirectoryWalker::sinkCanAbort() {
    Scanners::DirectoryWalker walker;
    DriveInfo drive;
    drive.id = QStringLiteral("t");
    drive.rootPath = m_dir->path();

    int seen = 0;
    QString err;
    QVERIFY(!walker.walk(drive, [&](RawEntry&&) { return ++seen < 2; }, &err));
    QCOMPARE(seen, 2);
    QVERIFY(!err.isEmpty());
}

void TestDirectoryWalker::directoryVanishingMidWalkFails() {
    Scanners::DirectoryWalker walker;
    DriveInfo drive;
    drive.id = QStringLiteral("t");
    drive.rootPath = m_dir->path();

    const QString docs = m_dir->filePath(QStringLiteral("docs"));
    bool removed = false;
    QString err;
    const bool ok = walker.walk(drive, [&](RawEntry&& e) {
        // Gone before the walker descends into it
        if (e.isDir && QString::fromStdString(e.fullPath) == docs) {
            removed = QDir(docs).removeRecursively();
        }
        return true;
    }, &err);

    QVERIFY(removed);
    QVERIFY(!ok);
    QVERIFY(err.contains(QStringLiteral("docs")));
}

QTEST_MAIN(TestDirectoryWalker)
#include "tst_directorywalker.moc"
