#pragma once

#include "CancellableWait.hpp"
#include "IRendererControl.hpp"
#include "ITopologyService.hpp"
#include "ZoneCreationWaiter.hpp"
#include "core/topology/ZoneResolver.hpp"
#include <QHash>
#include <optional>

namespace rlk {

struct Snapshot {
    QString key;
    QStringList rooms;
    QString uri;
    QString uriMetaData;
    QString absTime;
    int volume = 0;
    bool mute = false;
};

/// Saves and restores the playback state of a zone across regrouping.
///
/// Snapshots are keyed by the set of room names, so ["A", "B"] and
/// ["B", "A"] share one snapshot. Restoring is a multi-step sequence on the
/// renderer and is not atomic: a failure part-way leaves the zone partially
/// restored and keeps the snapshot.
class SnapshotManager {
public:
    struct Settings {
        int maxTransportRetries = 10;
        int transportPollMs = 100;
    };

    /// None of the collaborators are owned.
    SnapshotManager(const ZoneResolver& resolver, IRendererControl* renderer,
                    ITopologyService* topology, ZoneCreationWaiter* zoneWaiter,
                    const Settings& settings);

    static QString snapshotKey(const QStringList& roomNames);

    /// Capture URI, metadata, position, volume and mute of the zone.
    /// Returns false (and reads nothing) when a snapshot exists and replace
    /// is false. Throws UnknownRoomError, ZoneNotFoundError or whatever the
    /// renderer throws.
    bool save(const QStringList& roomNames, bool replace = false);

    /// Re-create the zone and replay the snapshot onto it. Returns false
    /// when there is no snapshot for these rooms.
    bool restore(const QStringList& roomNames, bool deleteAfter = true);

    bool hasSnapshot(const QStringList& roomNames) const;
    std::optional<Snapshot> snapshot(const QStringList& roomNames) const;
    void discard(const QStringList& roomNames);
    int count() const { return static_cast<int>(snapshots_.size()); }

    /// Interrupt a transport-settle wait in progress. Later restores wait
    /// normally again.
    void cancel() { transportWait_.cancel(); }

private:
    void recreateZone(const QStringList& roomNames);
    bool waitForTransport(const QString& location);

    const ZoneResolver& resolver_;
    IRendererControl* renderer_;
    ITopologyService* topology_;
    ZoneCreationWaiter* zoneWaiter_;
    Settings settings_;
    QHash<QString, Snapshot> snapshots_;
    CancellableWait transportWait_;
};

} // namespace rlk
