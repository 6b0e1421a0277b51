// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "IndexerService.h"

#include <memory>

#include <QDateTime>
#include <QMetaObject>
#include <QPointer>

#include <QtDBus/QDBusError>
#include <QtDBus/QDBusMessage>

#include "../DriveCatalog.h"
#include "../Logging.h"
#include "../Utils.h"
#include "../Version.h"

using namespace IndexEngine;

static constexpr int kMaxConcurrentStreams = 16;

// devices may be null; the mounted key is then left out
static QVariantMap driveStatusToVariant(const DriveStatus& st, const std::vector<DriveCatalog::BlockDevice>* devices) {
    QVariantMap m;
    m.insert(QStringLiteral("driveId"), st.info.id);
    m.insert(QStringLiteral("rootPath"), st.info.rootPath);
    m.insert(QStringLiteral("devNode"), st.info.devNode);
    m.insert(QStringLiteral("fsType"), st.info.fsType);
    m.insert(QStringLiteral("label"), st.info.label);
    m.insert(QStringLiteral("state"), stateName(st.state.kind));
    m.insert(QStringLiteral("reason"), st.state.reason);
    m.insert(QStringLiteral("generation"), QVariant::fromValue<qulonglong>(st.state.generationId));
    m.insert(QStringLiteral("entryCount"), QVariant::fromValue<qulonglong>(st.stats.liveRecords));
    m.insert(QStringLiteral("directoryCount"), QVariant::fromValue<qulonglong>(st.stats.directories));
    m.insert(QStringLiteral("totalBytes"), QVariant::fromValue<qulonglong>(st.stats.totalBytes));
    m.insert(QStringLiteral("lastIndexedTime"), QVariant::fromValue<qlonglong>(st.indexedAt));

    m.insert(QStringLiteral("lastIndexedText"),
             st.indexedAt > 0 ? QString::fromStdString(Utils::secondsToFormattedTime(st.indexedAt)) : QString());

    if (!devices) return m;

    bool mounted = true;
    if (!st.info.devNode.isEmpty()) {
        mounted = false;
        for (const DriveCatalog::BlockDevice& d : *devices) {
            if (d.devNode == st.info.devNode) {
                mounted = d.mounted();
                break;
            }
        }
    }
    m.insert(QStringLiteral("mounted"), mounted);
    return m;
}

IndexerService::IndexerService(FindexCore& core, QObject* parent)
    : QObject(parent)
    , m_core(core) {
    m_streamPool.setMaxThreadCount(kMaxConcurrentStreams);

    connect(&m_core, &FindexCore::driveIndexBuilding, this, &IndexerService::DriveIndexBuilding);
    connect(&m_core, &FindexCore::driveIndexReady, this,
            [this](const QString& driveId, quint64 recordCount, quint64 generationId) {
                Q_EMIT DriveIndexUpdated(driveId, generationId, recordCount);
            });
    connect(&m_core, &FindexCore::driveIndexFailed, this, &IndexerService::DriveIndexFailed);
    connect(&m_core, &FindexCore::indexRebuildFinished, this, &IndexerService::IndexRebuildFinished);
}

IndexerService::~IndexerService() {
    for (const auto& kv : m_currentSearch) {
        m_core.cancelSearch(kv.first);
    }
    m_streamPool.waitForDone();
}

QString IndexerService::callerKey() const {
    if (!calledFromDBus()) return QStringLiteral("local");
    return message().service(); // unique name like ":1.42"
}

void IndexerService::failCall(const QString& message) {
    qCWarning(lcService) << message;
    if (calledFromDBus()) {
        sendErrorReply(QDBusError::Failed, message);
    }
}

void IndexerService::Ping(QString& versionOut, quint32& apiVersionOut) const {
    versionOut = QString::fromUtf8(Version::VERSION.data(), static_cast<qsizetype>(Version::VERSION.size()));
    apiVersionOut = Version::API_VERSION;
}

void IndexerService::ListDrives(QVariantList& drivesOut) const {
    drivesOut.clear();

    const IndexStatusReport report = m_core.checkIndexStatus(DriveScope::all());
    const std::vector<DriveCatalog::BlockDevice> devices = DriveCatalog::listBlockDevices();

    for (const DriveStatus& st : report.drives) {
        drivesOut.push_back(driveStatusToVariant(st, &devices));
    }
}

void IndexerService::CheckIndexStatus(const QString& driveId, QVariantMap& statusOut) {
    const DriveScope scope = driveId.isEmpty() ? DriveScope::all() : DriveScope::drive(driveId);
    const IndexStatusReport report = m_core.checkIndexStatus(scope);

    if (report.unknownDrive) {
        failCall(QStringLiteral("Unknown driveId: %1").arg(driveId));
        return;
    }
    statusOut = statusToVariant(report);
}

quint32 IndexerService::BuildIndex(const QString& driveId) {
    if (driveId.isEmpty()) {
        const quint32 count = static_cast<quint32>(m_core.driveIds().size());
        // Summary is reported by the IndexRebuildFinished signal
        m_core.buildIndex(DriveScope::all());
        qCInfo(lcService) << "Rebuild of" << count << "drive(s) requested by" << callerKey();
        return count;
    }

    if (!m_core.drive(driveId)) {
        failCall(QStringLiteral("Unknown driveId: %1").arg(driveId));
        return 0;
    }

    m_core.buildDrive(driveId);
    qCInfo(lcService) << "Build of" << driveId << "requested by" << callerKey();
    return 1;
}

quint64 IndexerService::Search(const QString& query, const QString& driveId) {
    const QString key = callerKey();
    const DriveScope scope = driveId.isEmpty() ? DriveScope::all() : DriveScope::drive(driveId);

    auto stream = std::make_shared<SearchStream>(m_core.compileAndSearch(query, scope, key));
    const quint64 searchId = stream->searchId();
    m_currentSearch[key] = searchId;

    QPointer<IndexerService> self(this);
    m_streamPool.start([self, stream, key, searchId]() {
        while (std::optional<SearchEvent> ev = stream->next()) {
            if (!self) return;

            if (ev->kind == SearchEvent::Kind::Batch) {
                QVariantList rows;
                rows.reserve(static_cast<qsizetype>(ev->batch.hits.size()));
                for (const SearchHit& hit : ev->batch.hits) {
                    rows.push_back(hitToVariant(ev->batch.driveId, hit));
                }
                QMetaObject::invokeMethod(self.data(), [self, key, searchId, rows]() {
                    if (self) self->deliverBatch(key, searchId, rows);
                }, Qt::QueuedConnection);
            } else {
                const quint64 total = ev->completion.totalCount;
                const QVariantMap props = completionToVariant(ev->completion);
                QMetaObject::invokeMethod(self.data(), [self, key, searchId, total, props]() {
                    if (self) self->deliverFinished(key, searchId, total, props);
                }, Qt::QueuedConnection);
            }
        }
    });

    return searchId;
}

bool IndexerService::CancelSearch() {
    const QString key = callerKey();
    const bool cancelled = m_core.cancelSearch(key);
    m_currentSearch.erase(key);
    return cancelled;
}

bool IndexerService::ApplyFsDelta(const QString& driveId, const QVariantList& added, const QStringList& removedPaths) {
    if (!m_core.drive(driveId)) {
        failCall(QStringLiteral("Unknown driveId: %1").arg(driveId));
        return false;
    }

    std::vector<RawEntry> entries;
    entries.reserve(static_cast<size_t>(added.size()));
    for (const QVariant& v : added) {
        QString err;
        std::optional<RawEntry> e = rawEntryFromVariant(v.toMap(), &err);
        if (!e) {
            failCall(QStringLiteral("Malformed entry: %1").arg(err));
            return false;
        }
        entries.push_back(std::move(*e));
    }

    // Success reaches callers as DriveIndexUpdated through the core's driveIndexReady
    m_core.applyFsPathDelta(driveId, std::move(entries), removedPaths)
        .then(this, [driveId](const DeltaResult& r) {
            if (!r.ok) {
                qCWarning(lcService) << "Delta for" << driveId << "failed:" << r.error;
            }
        });
    return true;
}

void IndexerService::deliverBatch(const QString& sessionKey, quint64 searchId, const QVariantList& rows) {
    const auto it = m_currentSearch.find(sessionKey);
    if (it == m_currentSearch.end() || it->second != searchId) return;

    Q_EMIT ResultsBatch(searchId, rows);
}

void IndexerService::deliverFinished(const QString& sessionKey, quint64 searchId, quint64 total,
                                     const QVariantMap& props) {
    const auto it = m_currentSearch.find(sessionKey);
    if (it == m_currentSearch.end() || it->second != searchId) return;

    m_currentSearch.erase(it);
    Q_EMIT SearchFinished(searchId, total, props);
}

std::optional<RawEntry> IndexerService::rawEntryFromVariant(const QVariantMap& map, QString* errorOut) {
    const QString name = map.value(QStringLiteral("name")).toString();
    const QString fullPath = map.value(QStringLiteral("fullPath")).toString();
    if (name.isEmpty() || fullPath.isEmpty()) {
        if (errorOut) *errorOut = QStringLiteral("name and fullPath are required");
        return std::nullopt;
    }

    RawEntry e;
    e.name = name.toStdString();
    e.fullPath = fullPath.toStdString();
    e.size = map.value(QStringLiteral("size")).toULongLong();
    e.mtime = map.value(QStringLiteral("mtime")).toLongLong();
    e.isDir = map.value(QStringLiteral("isDir")).toBool();

    if (map.value(QStringLiteral("hidden")).toBool() || name.startsWith(QLatin1Char('.'))) {
        e.attributes |= AttrHidden;
    }
    if (map.value(QStringLiteral("readOnly")).toBool()) {
        e.attributes |= AttrReadOnly;
    }
    return e;
}

QVariantMap IndexerService::hitToVariant(const QString& driveId, const SearchHit& hit) {
    QVariantMap row;
    row.insert(QStringLiteral("driveId"), driveId);
    row.insert(QStringLiteral("name"), QString::fromStdString(hit.name));
    row.insert(QStringLiteral("fullPath"), QString::fromStdString(hit.fullPath));
    row.insert(QStringLiteral("size"), QVariant::fromValue<qulonglong>(hit.size));
    row.insert(QStringLiteral("mtime"), QVariant::fromValue<qlonglong>(hit.mtime));
    row.insert(QStringLiteral("isDir"), hit.isDir);
    return row;
}

QVariantMap IndexerService::completionToVariant(const SearchCompletion& completion) {
    QString status;
    switch (completion.status) {
        case SearchCompletion::Status::Completed: status = QStringLiteral("completed"); break;
        case SearchCompletion::Status::NotReady: status = QStringLiteral("notReady"); break;
        case SearchCompletion::Status::UnknownDrive: status = QStringLiteral("unknownDrive"); break;
    }

    QVariantList drives;
    for (const DriveSearchReport& d : completion.drives) {
        QString outcome;
        switch (d.outcome) {
            case DriveSearchReport::Outcome::Searched: outcome = QStringLiteral("searched"); break;
            case DriveSearchReport::Outcome::SkippedNotReady: outcome = QStringLiteral("skippedNotReady"); break;
            case DriveSearchReport::Outcome::NotReady: outcome = QStringLiteral("notReady"); break;
            case DriveSearchReport::Outcome::Unknown: outcome = QStringLiteral("unknown"); break;
        }

        QVariantMap m;
        m.insert(QStringLiteral("driveId"), d.driveId);
        m.insert(QStringLiteral("outcome"), outcome);
        m.insert(QStringLiteral("emitted"), QVariant::fromValue<qulonglong>(d.emitted));
        m.insert(QStringLiteral("matched"), QVariant::fromValue<qulonglong>(d.matched));
        m.insert(QStringLiteral("truncated"), d.truncated);
        drives.push_back(m);
    }

    QVariantMap props;
    props.insert(QStringLiteral("status"), status);
    props.insert(QStringLiteral("totalMatches"), QVariant::fromValue<qulonglong>(completion.totalMatches));
    props.insert(QStringLiteral("truncated"), completion.truncated);
    props.insert(QStringLiteral("elapsedMs"), QVariant::fromValue<qlonglong>(completion.elapsedMs));
    props.insert(QStringLiteral("drives"), drives);
    return props;
}

QVariantMap IndexerService::statusToVariant(const IndexStatusReport& report) {
    QVariantList drives;
    for (const DriveStatus& st : report.drives) {
        drives.push_back(driveStatusToVariant(st, nullptr));
    }

    QVariantMap out;
    out.insert(QStringLiteral("readyCount"), report.readyCount);
    out.insert(QStringLiteral("totalDrives"), report.totalDrives);
    out.insert(QStringLiteral("totalFiles"), QVariant::fromValue<qulonglong>(report.totalFiles));
    out.insert(QStringLiteral("drives"), drives);
    return out;
}
