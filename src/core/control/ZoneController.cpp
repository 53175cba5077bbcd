#include "ZoneController.hpp"
#include "core/topology/Errors.hpp"
#include <boost/log/trivial.hpp>

namespace rlk {

ZoneController::ZoneController(const ZoneResolver& resolver, IRendererControl* renderer,
                               ITopologyService* topology, ZoneCreationWaiter* zoneWaiter)
    : resolver_(resolver)
    , renderer_(renderer)
    , topology_(topology)
    , zoneWaiter_(zoneWaiter)
{
}

// --- Topology ---

void ZoneController::createZone(const QStringList& roomNames)
{
    const QStringList roomUdns = resolver_.roomsToUdns(roomNames);
    const auto oldZoneId = resolver_.roomUdnsToZoneId(roomUdns);
    BOOST_LOG_TRIVIAL(info) << "[ZoneController] creating zone [" << roomNames.join(", ").toStdString() << "]";
    topology_->connectRoomsToZone(QString(), roomUdns);
    zoneWaiter_->wait(oldZoneId, roomUdns);
}

void ZoneController::addRoomToZone(const QString& roomName, const QStringList& zoneRoomNames)
{
    const auto zoneId = resolver_.roomsToZoneId(zoneRoomNames);
    if (!zoneId)
        throw ZoneNotFoundError(zoneRoomNames);
    topology_->connectRoomToZone(*zoneId, resolver_.roomUdn(roomName));
}

void ZoneController::dropRoom(const QString& roomName)
{
    topology_->dropRoom(resolver_.roomUdn(roomName));
}

void ZoneController::enterAutomaticStandby(const QString& roomName)
{
    topology_->enterAutomaticStandby(resolver_.roomUdn(roomName));
}

void ZoneController::enterManualStandby(const QString& roomName)
{
    topology_->enterManualStandby(resolver_.roomUdn(roomName));
}

void ZoneController::leaveStandby(const QString& roomName)
{
    topology_->leaveStandby(resolver_.roomUdn(roomName));
}

// --- Volume ---

int ZoneController::zoneVolume(const QStringList& zoneRooms)
{
    return renderer_->volume(resolver_.zoneLocation(zoneRooms));
}

void ZoneController::setZoneVolume(const QStringList& zoneRooms, int volume)
{
    renderer_->setVolume(resolver_.zoneLocation(zoneRooms), volume);
}

void ZoneController::changeZoneVolume(const QStringList& zoneRooms, int amount)
{
    renderer_->changeVolume(resolver_.zoneLocation(zoneRooms), amount);
}

void ZoneController::setZoneRoomVolume(const QStringList& zoneRooms, int volume,
                                       const std::optional<QStringList>& rooms)
{
    const QString location = resolver_.zoneLocation(zoneRooms);
    const QStringList roomUdns = resolver_.roomsToUdns(rooms.value_or(zoneRooms));
    for (const auto& roomUdn : roomUdns)
        renderer_->setRoomVolume(location, roomUdn, volume);
}

bool ZoneController::zoneMute(const QStringList& zoneRooms)
{
    return renderer_->mute(resolver_.zoneLocation(zoneRooms));
}

void ZoneController::setZoneMute(const QStringList& zoneRooms, bool mute)
{
    renderer_->setMute(resolver_.zoneLocation(zoneRooms), mute);
}

// --- Transport ---

void ZoneController::play(const QStringList& zoneRooms)
{
    renderer_->play(resolver_.zoneLocation(zoneRooms));
}

void ZoneController::pause(const QStringList& zoneRooms)
{
    renderer_->pause(resolver_.zoneLocation(zoneRooms));
}

void ZoneController::stop(const QStringList& zoneRooms)
{
    renderer_->stop(resolver_.zoneLocation(zoneRooms));
}

void ZoneController::nextTrack(const QStringList& zoneRooms)
{
    renderer_->next(resolver_.zoneLocation(zoneRooms));
}

void ZoneController::previousTrack(const QStringList& zoneRooms)
{
    renderer_->previous(resolver_.zoneLocation(zoneRooms));
}

void ZoneController::seek(const QStringList& zoneRooms, const QString& absTime)
{
    renderer_->seek(resolver_.zoneLocation(zoneRooms), kSeekAbsTime, absTime);
}

void ZoneController::setTransportUri(const QStringList& zoneRooms, const QString& uri,
                                     const QString& metaData)
{
    renderer_->setTransportUri(resolver_.zoneLocation(zoneRooms), uri, metaData);
}

QString ZoneController::playMode(const QStringList& zoneRooms)
{
    return renderer_->transportSettings(resolver_.zoneLocation(zoneRooms)).playMode;
}

void ZoneController::setPlayMode(const QStringList& zoneRooms, const QString& playMode)
{
    renderer_->setPlayMode(resolver_.zoneLocation(zoneRooms), playMode);
}

// --- Queries ---

MediaInfo ZoneController::mediaInfo(const QStringList& zoneRooms)
{
    return renderer_->mediaInfo(resolver_.zoneLocation(zoneRooms));
}

PositionInfo ZoneController::positionInfo(const QStringList& zoneRooms)
{
    return renderer_->positionInfo(resolver_.zoneLocation(zoneRooms));
}

TransportInfo ZoneController::transportInfo(const QStringList& zoneRooms)
{
    return renderer_->transportInfo(resolver_.zoneLocation(zoneRooms));
}

QString ZoneController::zonePosition(const QStringList& zoneRooms)
{
    return positionInfo(zoneRooms).absTime;
}

} // namespace rlk
