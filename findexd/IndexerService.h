// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_FINDEXD_INDEXERSERVICE_H
#define FINDEX_FINDEXD_INDEXERSERVICE_H

#include <map>
#include <optional>

#include <QObject>
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <QVariant>
#include <QVariantList>
#include <QVariantMap>

#include <QtDBus/QDBusContext>

#include "../FindexCore.h"

class IndexerService final : public QObject, protected QDBusContext {
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "net.findex.Findex1.Indexer")

public:
    explicit IndexerService(FindexCore& core, QObject* parent = nullptr);
    ~IndexerService() override;

    /**
     * Converts one added entry as sent over D-Bus ({name, fullPath, size, mtime, isDir,
     * hidden, readOnly}) into a RawEntry. name and fullPath are required.
     */
    [[nodiscard]] static std::optional<IndexEngine::RawEntry> rawEntryFromVariant(const QVariantMap& map,
                                                                                 QString* errorOut = nullptr);

    [[nodiscard]] static QVariantMap hitToVariant(const QString& driveId, const IndexEngine::SearchHit& hit);
    [[nodiscard]] static QVariantMap completionToVariant(const IndexEngine::SearchCompletion& completion);
    [[nodiscard]] static QVariantMap statusToVariant(const IndexEngine::IndexStatusReport& report);

public slots:
    /**
     * Provides version information about the service and its API.
     *
     * @param versionOut Populated with the service version string.
     * @param apiVersionOut Populated with the API version integer.
     */
    void Ping(QString& versionOut, quint32& apiVersionOut) const;

    /**
     * Lists the registered drives.
     *
     * @param drivesOut Populated with one dict per drive:
     *                  - driveId, rootPath, devNode, fsType, label: strings
     *                  - state: "notBuilt", "building", "ready" or "failed"
     *                  - reason: failure reason, empty unless failed
     *                  - generation, entryCount: uint64
     *                  - lastIndexedTime: int64 unix seconds (0 = never)
     *                  - lastIndexedText: lastIndexedTime as local "YYYY-MM-DD HH:MM:SS", empty if never
     *                  - mounted: bool, for drives backed by a known block device
     */
    void ListDrives(QVariantList& drivesOut) const;

    /**
     * @param driveId Drive to report on, or empty for all drives.
     * @param statusOut {readyCount, totalDrives, totalFiles, drives}, where drives is a
     *                  list of dicts as in ListDrives().
     */
    void CheckIndexStatus(const QString& driveId, QVariantMap& statusOut);

    /**
     * Starts building (or rebuilding) one drive, or every drive when driveId is empty.
     * Progress is reported through the DriveIndex* signals, the end of a rebuild of
     * all drives through IndexRebuildFinished.
     *
     * @return The number of drives queued.
     */
    quint32 BuildIndex(const QString& driveId);

    /**
     * Starts a search. Results arrive as ResultsBatch signals followed by one
     * SearchFinished with the same search id. A new search by the same caller
     * supersedes the previous one; the superseded search emits nothing more.
     *
     * @param query Raw query text.
     * @param driveId Drive to search, or empty for all drives.
     * @return The search id.
     */
    quint64 Search(const QString& query, const QString& driveId);

    /**
     * Cancels the caller's running search, if any.
     */
    bool CancelSearch();

    /**
     * Applies filesystem changes to a drive's index.
     *
     * @param added Dicts as accepted by rawEntryFromVariant().
     * @param removedPaths Full paths of removed entries.
     * @return false with an error reply for unknown drives or malformed entries.
     */
    bool ApplyFsDelta(const QString& driveId, const QVariantList& added, const QStringList& removedPaths);

signals:
    void ResultsBatch(quint64 searchId, const QVariantList& rows);
    void SearchFinished(quint64 searchId, quint64 total, const QVariantMap& props);

    void DriveIndexBuilding(const QString& driveId);
    void DriveIndexUpdated(const QString& driveId, quint64 generation, quint64 entryCount);
    void DriveIndexFailed(const QString& driveId, const QString& reason);
    void IndexRebuildFinished(const QStringList& built, const QStringList& failed);

private:
    [[nodiscard]] QString callerKey() const;
    void failCall(const QString& message);

    // Called on the service thread only
    void deliverBatch(const QString& sessionKey, quint64 searchId, const QVariantList& rows);
    void deliverFinished(const QString& sessionKey, quint64 searchId, quint64 total, const QVariantMap& props);

    FindexCore& m_core;

    // Drains search streams; next() blocks
    QThreadPool m_streamPool;

    // caller key -> id of its current search; service thread only
    std::map<QString, quint64> m_currentSearch;
};

#endif //FINDEX_FINDEXD_INDEXERSERVICE_H
