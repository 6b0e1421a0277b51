// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <memory>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDBusConnection>
#include <QDBusError>
#include <QDebug>
#include <QSettings>

#include "../EngineConfig.h"
#include "../FindexCore.h"
#include "../Logging.h"
#include "../Version.h"
#include "IndexerService.h"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("findexd");
    QCoreApplication::setOrganizationName("findex");
    QCoreApplication::setOrganizationDomain("findex.net");
    QCoreApplication::setApplicationVersion(
        QString::fromUtf8(Version::VERSION.data(), static_cast<qsizetype>(Version::VERSION.size())));

    constexpr const char* kServiceName = "net.findex.Findex1";
    constexpr const char* kObjectPath  = "/net/findex/Findex1";

    QCommandLineParser parser;
    parser.setApplicationDescription("Filesystem metadata index and search service");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(QStringList{"c", "config"}, "Read settings from this INI file.", "file");
    const QCommandLineOption rootOption(QStringList{"r", "root"}, "Index this directory (repeatable; id=path accepted).", "path");
    const QCommandLineOption sessionBusOption("session-bus", "Register on the session bus instead of the system bus.");
    const QCommandLineOption noBuildOption("no-initial-build", "Do not build drives without a snapshot at startup.");
    parser.addOption(configOption);
    parser.addOption(rootOption);
    parser.addOption(sessionBusOption);
    parser.addOption(noBuildOption);
    parser.process(app);

    std::unique_ptr<QSettings> settings;
    if (parser.isSet(configOption)) {
        settings = std::make_unique<QSettings>(parser.value(configOption), QSettings::IniFormat);
        if (settings->status() != QSettings::NoError) {
            qCritical() << "Failed to read config file" << parser.value(configOption);
            return 4;
        }
    } else {
        settings = std::make_unique<QSettings>();
    }

    IndexEngine::EngineConfig config = IndexEngine::loadConfig(*settings);
    for (const QString& spec : parser.values(rootOption)) {
        config.roots.push_back(IndexEngine::driveFromRootSpec(spec));
    }

    auto conn = parser.isSet(sessionBusOption) ? QDBusConnection::sessionBus() : QDBusConnection::systemBus();
    if (!conn.isConnected()) {
        qCritical() << "Failed to connect to D-Bus:" << conn.lastError().message();
        return 1;
    }

    if (!conn.registerService(kServiceName)) {
        qCritical() << "Failed to register service" << kServiceName << ":" << conn.lastError().message();
        return 2;
    }

    FindexCore core(std::move(config));
    IndexerService svc(core);

    if (!conn.registerObject(kObjectPath, &svc,
                             QDBusConnection::ExportAllSlots | QDBusConnection::ExportAllSignals)) {
        qCritical() << "Failed to register object" << kObjectPath << ":" << conn.lastError().message();
        return 3;
    }

    const int restored = core.restoreSnapshots();
    qCInfo(lcService) << "Restored" << restored << "of" << core.driveIds().size() << "drive(s) from snapshots";

    if (!parser.isSet(noBuildOption)) {
        for (const QString& id : core.driveIds()) {
            const std::optional<IndexEngine::DriveEntry> e = core.drive(id);
            if (e && e->state.kind == IndexEngine::IndexState::Kind::NotBuilt) {
                core.buildDrive(id);
            }
        }
    }

    qInfo() << "findexd running as" << kServiceName << "object" << kObjectPath;
    return app.exec();
}
