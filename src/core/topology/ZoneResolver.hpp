#pragma once

#include "TopologyStore.hpp"
#include <QStringList>
#include <optional>

namespace rlk {

/// Read-only queries over a TopologyStore. Every call takes fresh snapshots,
/// so results follow the latest applied updates.
///
/// A zone is addressed by the set of its room names; order and repetitions
/// in the argument list do not matter.
class ZoneResolver {
public:
    explicit ZoneResolver(const TopologyStore& store);

    /// Throws UnknownRoomError if the room is not in the zone index.
    QString roomUdn(const QString& roomName) const;

    /// Throws UnknownRoomError on the first unknown name.
    QStringList roomsToUdns(const QStringList& roomNames) const;

    /// Zone whose member set equals the rooms' udn set, or nullopt when the
    /// rooms are not currently grouped that way. Throws UnknownRoomError.
    std::optional<QString> roomsToZoneId(const QStringList& roomNames) const;
    std::optional<QString> roomUdnsToZoneId(const QStringList& roomUdns) const;

    bool isValidZoneGrouping(const QStringList& roomNames) const;

    /// Unknown for rooms that are not in the index.
    PowerState roomPowerState(const QString& roomName) const;

    /// Sorted room names per zone, in host order.
    QList<QStringList> zones() const;
    QStringList rooms() const;

    std::optional<QString> roomName(const QString& roomUdn) const;
    std::optional<QString> zoneOfRoom(const QString& roomName) const;
    std::optional<QString> deviceLocation(const QString& udn) const;

    /// Control location of the zone formed by roomNames.
    /// Throws ZoneNotFoundError when there is no such zone or it has no device yet.
    QString zoneLocation(const QStringList& roomNames) const;

    std::optional<QString> mediaServerLocation() const;

    QString hostName() const;
    QString hostRoom() const;
    bool updateAvailable() const;

private:
    static std::optional<QString> matchZone(const ZoneIndex& index, const QStringList& roomUdns);

    const TopologyStore& store_;
};

} // namespace rlk
