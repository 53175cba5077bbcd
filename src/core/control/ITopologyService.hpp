#pragma once

#include <QString>
#include <QStringList>

namespace rlk {

/// Zone membership and room power requests.
///
/// All calls are fire-and-forget: the host applies them asynchronously and
/// the only confirmation is the topology converging in a later zone-config
/// update.
class ITopologyService {
public:
    virtual ~ITopologyService() = default;

    /// Put roomUdn into zoneUdn. An empty or unknown zoneUdn creates a new
    /// zone; an empty roomUdn means every room with an active renderer.
    virtual void connectRoomToZone(const QString& zoneUdn, const QString& roomUdn) = 0;

    /// Same as connectRoomToZone for several rooms at once.
    virtual void connectRoomsToZone(const QString& zoneUdn, const QStringList& roomUdns) = 0;

    virtual void dropRoom(const QString& roomUdn) = 0;

    virtual void enterAutomaticStandby(const QString& roomUdn) = 0;
    virtual void enterManualStandby(const QString& roomUdn) = 0;
    virtual void leaveStandby(const QString& roomUdn) = 0;
};

} // namespace rlk
