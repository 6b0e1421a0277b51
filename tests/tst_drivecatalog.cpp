// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QTemporaryFile>
#include <QtTest>

#include "DriveCatalog.h"

class TestDriveCatalog : public QObject {
    Q_OBJECT

private slots:
    void parsesMountInfo();
    void decodesEscapedMountPoints();
    void rejectsMalformedLines_data();
    void rejectsMalformedLines();
    void primaryMountPoint_data();
    void primaryMountPoint();
    void superblockRejectsNonFilesystems();
};

void TestDriveCatalog::parsesMountInfo() {
    const auto e = DriveCatalog::parseMountInfoLine(
        "36 35 98:0 /mnt1 /mnt/data rw,noatime master:1 - ext4 /dev/sda1 rw,errors=continue");
    QVERIFY(e);
    QCOMPARE(e->mountPoint, std::string("/mnt/data"));
    QCOMPARE(e->mountSource, std::string("/dev/sda1"));
    QCOMPARE(e->fsType, std::string("ext4"));

    // No optional fields
    const auto bare = DriveCatalog::parseMountInfoLine("22 1 0:21 / /proc rw - proc proc rw");
    QVERIFY(bare);
    QCOMPARE(bare->mountPoint, std::string("/proc"));
}

void TestDriveCatalog::decodesEscapedMountPoints() {
    const auto e = DriveCatalog::parseMountInfoLine(
        "40 35 8:17 / /media/me/My\\040Disk rw shared:7 - vfat /dev/sdb1 rw");
    QVERIFY(e);
    QCOMPARE(e->mountPoint, std::string("/media/me/My Disk"));

    const auto trailing = DriveCatalog::parseMountInfoLine("41 35 8:18 / /mnt/x\\040 rw - ext4 /dev/sdb2 rw");
    QVERIFY(trailing);
    QCOMPARE(trailing->mountPoint, std::string("/mnt/x "));

    // Not an escape
    const auto partial = DriveCatalog::parseMountInfoLine("42 35 8:19 / /mnt/a\\9b rw - ext4 /dev/sdb3 rw");
    QVERIFY(partial);
    QCOMPARE(partial->mountPoint, std::string("/mnt/a\\9b"));
}

void TestDriveCatalog::rejectsMalformedLines_data() {
    QTest::addColumn<QString>("line");

    QTest::newRow("empty") << "";
    QTest::newRow("no separator") << "36 35 98:0 /mnt1 /mnt/data rw ext4 /dev/sda1 rw";
    QTest::newRow("short left") << "36 35 98:0 / - ext4 /dev/sda1 rw";
    QTest::newRow("short right") << "36 35 98:0 / /mnt rw - ext4";
}

void TestDriveCatalog::rejectsMalformedLines() {
    QFETCH(QString, line);
    QVERIFY(!DriveCatalog::parseMountInfoLine(line.toStdString()));
}

void TestDriveCatalog::primaryMountPoint_data() {
    QTest::addColumn<QStringList>("mounts");
    QTest::addColumn<QString>("expected");

    QTest::newRow("empty") << QStringList{} << QString();
    QTest::newRow("single") << QStringList{QStringLiteral("/")} << QStringLiteral("/");
    QTest::newRow("prefers mnt")
        << QStringList{QStringLiteral("/"), QStringLiteral("/mnt/data/long"), QStringLiteral("/mnt/d")}
        << QStringLiteral("/mnt/d");
    QTest::newRow("prefers media")
        << QStringList{QStringLiteral("/srv"), QStringLiteral("/media/me/usb")}
        << QStringLiteral("/media/me/usb");
    QTest::newRow("lookalike prefix is not preferred")
        << QStringList{QStringLiteral("/mntx/data"), QStringLiteral("/srv/d")}
        << QStringLiteral("/srv/d");
    QTest::newRow("tie goes alphabetical")
        << QStringList{QStringLiteral("/mnt/b"), QStringLiteral("/mnt/a"), QStringLiteral("/srv")}
        << QStringLiteral("/mnt/a");
    QTest::newRow("shortest otherwise")
        << QStringList{QStringLiteral("/home/me/bind"), QStringLiteral("/data")}
        << QStringLiteral("/data");
}

void TestDriveCatalog::primaryMountPoint() {
    QFETCH(QStringList, mounts);
    QFETCH(QString, expected);
    QCOMPARE(DriveCatalog::pickPrimaryMountPoint(mounts), expected);
}

void TestDriveCatalog::superblockRejectsNonFilesystems() {
    QString err;
    QVERIFY(!DriveCatalog::readSuperblock("/nonexistent/findex-device", &err));
    QVERIFY(err.contains(QStringLiteral("findex-device")));

    QTemporaryFile blank;
    QVERIFY(blank.open());
    blank.write(QByteArray(64 * 1024, '\0'));
    blank.flush();

    err.clear();
    QVERIFY(!DriveCatalog::readSuperblock(blank.fileName().toStdString(), &err));
    QVERIFY(!err.isEmpty());
}

QTEST_MAIN(TestDriveCatalog)
#include "tst_drivecatalog.moc"
