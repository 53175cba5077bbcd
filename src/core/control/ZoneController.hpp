#pragma once

#include "IRendererControl.hpp"
#include "ITopologyService.hpp"
#include "ZoneCreationWaiter.hpp"
#include "core/topology/ZoneResolver.hpp"
#include <optional>

namespace rlk {

/// Zone-addressed control: every call takes the zone as a list of room
/// names, resolves it to the zone's control location and forwards to the
/// renderer. Throws UnknownRoomError / ZoneNotFoundError when the rooms do
/// not currently form a zone, plus whatever the renderer throws.
class ZoneController {
public:
    ZoneController(const ZoneResolver& resolver, IRendererControl* renderer,
                   ITopologyService* topology, ZoneCreationWaiter* zoneWaiter);

    // Topology
    void createZone(const QStringList& roomNames);
    void addRoomToZone(const QString& roomName, const QStringList& zoneRoomNames);
    void dropRoom(const QString& roomName);
    void enterAutomaticStandby(const QString& roomName);
    void enterManualStandby(const QString& roomName);
    void leaveStandby(const QString& roomName);

    // Volume
    int zoneVolume(const QStringList& zoneRooms);
    void setZoneVolume(const QStringList& zoneRooms, int volume);
    void changeZoneVolume(const QStringList& zoneRooms, int amount);
    /// Sets every room in rooms (default: all rooms of the zone) to volume.
    void setZoneRoomVolume(const QStringList& zoneRooms, int volume,
                           const std::optional<QStringList>& rooms = std::nullopt);
    bool zoneMute(const QStringList& zoneRooms);
    void setZoneMute(const QStringList& zoneRooms, bool mute);

    // Transport
    void play(const QStringList& zoneRooms);
    void pause(const QStringList& zoneRooms);
    void stop(const QStringList& zoneRooms);
    void nextTrack(const QStringList& zoneRooms);
    void previousTrack(const QStringList& zoneRooms);
    void seek(const QStringList& zoneRooms, const QString& absTime);
    void setTransportUri(const QStringList& zoneRooms, const QString& uri, const QString& metaData);
    QString playMode(const QStringList& zoneRooms);
    void setPlayMode(const QStringList& zoneRooms, const QString& playMode);

    // Queries
    MediaInfo mediaInfo(const QStringList& zoneRooms);
    PositionInfo positionInfo(const QStringList& zoneRooms);
    TransportInfo transportInfo(const QStringList& zoneRooms);
    QString zonePosition(const QStringList& zoneRooms);

private:
    const ZoneResolver& resolver_;
    IRendererControl* renderer_;
    ITopologyService* topology_;
    ZoneCreationWaiter* zoneWaiter_;
};

} // namespace rlk
