#include "SnapshotManager.hpp"
#include <boost/log/trivial.hpp>

namespace rlk {

SnapshotManager::SnapshotManager(const ZoneResolver& resolver, IRendererControl* renderer,
                                 ITopologyService* topology, ZoneCreationWaiter* zoneWaiter,
                                 const Settings& settings)
    : resolver_(resolver)
    , renderer_(renderer)
    , topology_(topology)
    , zoneWaiter_(zoneWaiter)
    , settings_(settings)
{
}

QString SnapshotManager::snapshotKey(const QStringList& roomNames)
{
    QStringList names = roomNames;
    names.removeDuplicates();
    names.sort();
    return names.join(QChar(0x1f));
}

bool SnapshotManager::save(const QStringList& roomNames, bool replace)
{
    const QString key = snapshotKey(roomNames);
    if (!replace && snapshots_.contains(key))
        return false;

    const QString location = resolver_.zoneLocation(roomNames);
    const MediaInfo media = renderer_->mediaInfo(location);
    const PositionInfo position = renderer_->positionInfo(location);

    Snapshot snap;
    snap.key = key;
    snap.rooms = roomNames;
    snap.uri = media.currentUri;
    snap.uriMetaData = media.currentUriMetaData;
    snap.absTime = position.absTime;
    snap.volume = renderer_->volume(location);
    snap.mute = renderer_->mute(location);
    snapshots_.insert(key, snap);

    BOOST_LOG_TRIVIAL(info) << "[SnapshotManager] saved [" << roomNames.join(", ").toStdString()
                            << "] at " << snap.absTime.toStdString();
    return true;
}

bool SnapshotManager::restore(const QStringList& roomNames, bool deleteAfter)
{
    const QString key = snapshotKey(roomNames);
    const auto it = snapshots_.constFind(key);
    if (it == snapshots_.constEnd())
        return false;
    const Snapshot snap = it.value();
    transportWait_.reset();

    recreateZone(snap.rooms);
    const QString location = resolver_.zoneLocation(snap.rooms);

    // Silence first so switching the URI is not audible at the old level.
    renderer_->setVolume(location, 0);
    renderer_->setMute(location, snap.mute);
    renderer_->setTransportUri(location, snap.uri, snap.uriMetaData);

    if (!waitForTransport(location)) {
        BOOST_LOG_TRIVIAL(info) << "[SnapshotManager] transport still transitioning, seeking anyway";
    }

    renderer_->seek(location, kSeekAbsTime, snap.absTime);
    renderer_->setVolume(location, snap.volume);

    if (deleteAfter)
        snapshots_.remove(key);

    BOOST_LOG_TRIVIAL(info) << "[SnapshotManager] restored [" << roomNames.join(", ").toStdString()
                            << "]";
    return true;
}

void SnapshotManager::recreateZone(const QStringList& roomNames)
{
    const QStringList roomUdns = resolver_.roomsToUdns(roomNames);
    const auto oldZoneId = resolver_.roomUdnsToZoneId(roomUdns);
    topology_->connectRoomsToZone(QString(), roomUdns);
    zoneWaiter_->wait(oldZoneId, roomUdns);
}

bool SnapshotManager::waitForTransport(const QString& location)
{
    for (int i = 0; i < settings_.maxTransportRetries; ++i) {
        if (renderer_->transportInfo(location).state != kTransportTransitioning)
            return true;
        if (i == settings_.maxTransportRetries - 1)
            break;
        if (!transportWait_.sleep(settings_.transportPollMs))
            return false;
    }
    return false;
}

bool SnapshotManager::hasSnapshot(const QStringList& roomNames) const
{
    return snapshots_.contains(snapshotKey(roomNames));
}

std::optional<Snapshot> SnapshotManager::snapshot(const QStringList& roomNames) const
{
    const auto it = snapshots_.constFind(snapshotKey(roomNames));
    if (it == snapshots_.constEnd())
        return std::nullopt;
    return it.value();
}

void SnapshotManager::discard(const QStringList& roomNames)
{
    snapshots_.remove(snapshotKey(roomNames));
}

} // namespace rlk
