#include "ZoneResolver.hpp"
#include "Errors.hpp"
#include <QSet>
#include <boost/log/trivial.hpp>

namespace rlk {

namespace {

QSet<QString> toSet(const QStringList& values)
{
    return QSet<QString>(values.begin(), values.end());
}

QStringList udnsFor(const ZoneIndex& index, const QStringList& roomNames)
{
    QStringList udns;
    udns.reserve(roomNames.size());
    for (const auto& name : roomNames) {
        const auto it = index.roomNameToUdn.constFind(name);
        if (it == index.roomNameToUdn.constEnd())
            throw UnknownRoomError(name);
        udns.append(it.value());
    }
    return udns;
}

QStringList normalized(const QStringList& roomNames)
{
    QStringList result = roomNames;
    result.removeDuplicates();
    result.sort();
    return result;
}

} // namespace

ZoneResolver::ZoneResolver(const TopologyStore& store)
    : store_(store)
{
}

QString ZoneResolver::roomUdn(const QString& roomName) const
{
    const auto index = store_.zoneIndex();
    const auto it = index->roomNameToUdn.constFind(roomName);
    if (it == index->roomNameToUdn.constEnd())
        throw UnknownRoomError(roomName);
    return it.value();
}

QStringList ZoneResolver::roomsToUdns(const QStringList& roomNames) const
{
    return udnsFor(*store_.zoneIndex(), roomNames);
}

std::optional<QString> ZoneResolver::roomsToZoneId(const QStringList& roomNames) const
{
    // Names and zones must come from the same snapshot.
    const auto index = store_.zoneIndex();
    return matchZone(*index, udnsFor(*index, roomNames));
}

std::optional<QString> ZoneResolver::roomUdnsToZoneId(const QStringList& roomUdns) const
{
    return matchZone(*store_.zoneIndex(), roomUdns);
}

std::optional<QString> ZoneResolver::matchZone(const ZoneIndex& index, const QStringList& roomUdns)
{
    const QSet<QString> wanted = toSet(roomUdns);
    std::optional<QString> match;
    for (const auto& zone : index.zones) {
        if (toSet(zone.roomUdns) != wanted)
            continue;
        if (!match) {
            match = zone.udn;
            continue;
        }
        // Two active zones with one room set; the first one stays authoritative.
        BOOST_LOG_TRIVIAL(warning) << "[ZoneResolver] zones " << match->toStdString()
                                   << " and " << zone.udn.toStdString()
                                   << " share the same rooms, using the first";
    }
    return match;
}

bool ZoneResolver::isValidZoneGrouping(const QStringList& roomNames) const
{
    const auto index = store_.zoneIndex();
    return index->zoneRoomNames.contains(normalized(roomNames));
}

PowerState ZoneResolver::roomPowerState(const QString& roomName) const
{
    const auto index = store_.zoneIndex();
    const QString udn = index->roomNameToUdn.value(roomName);
    if (udn.isEmpty())
        return PowerState::Unknown;
    return index->roomsByUdn.value(udn).powerState;
}

QList<QStringList> ZoneResolver::zones() const
{
    return store_.zoneIndex()->zoneRoomNames;
}

QStringList ZoneResolver::rooms() const
{
    return store_.zoneIndex()->roomNames;
}

std::optional<QString> ZoneResolver::roomName(const QString& roomUdn) const
{
    const auto index = store_.zoneIndex();
    const auto it = index->roomsByUdn.constFind(roomUdn);
    if (it == index->roomsByUdn.constEnd())
        return std::nullopt;
    return it->name;
}

std::optional<QString> ZoneResolver::zoneOfRoom(const QString& roomName) const
{
    const auto index = store_.zoneIndex();
    const QString udn = index->roomNameToUdn.value(roomName);
    const QString zoneUdn = index->roomsByUdn.value(udn).zoneUdn;
    if (zoneUdn.isEmpty())
        return std::nullopt;
    return zoneUdn;
}

std::optional<QString> ZoneResolver::deviceLocation(const QString& udn) const
{
    const auto directory = store_.deviceDirectory();
    const auto it = directory->devicesByUdn.constFind(udn);
    if (it == directory->devicesByUdn.constEnd())
        return std::nullopt;
    return it->location;
}

QString ZoneResolver::zoneLocation(const QStringList& roomNames) const
{
    const auto zoneId = roomsToZoneId(roomNames);
    if (!zoneId)
        throw ZoneNotFoundError(roomNames);
    const auto location = deviceLocation(*zoneId);
    if (!location)
        throw ZoneNotFoundError(roomNames);
    return *location;
}

std::optional<QString> ZoneResolver::mediaServerLocation() const
{
    const auto directory = store_.deviceDirectory();
    if (directory->mediaServerUdn.isEmpty())
        return std::nullopt;
    return deviceLocation(directory->mediaServerUdn);
}

QString ZoneResolver::hostName() const
{
    return store_.hostInfo()->hostName();
}

QString ZoneResolver::hostRoom() const
{
    return store_.hostInfo()->roomName();
}

bool ZoneResolver::updateAvailable() const
{
    return store_.systemState()->updateAvailable;
}

} // namespace rlk
