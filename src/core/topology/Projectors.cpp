#include "Projectors.hpp"

namespace rlk {

namespace {

void addRoom(ZoneIndex& index, const RoomEntry& entry, const QString& zoneUdn)
{
    Room room;
    room.name = entry.name;
    room.udn = entry.udn;
    room.powerState = entry.powerState.value_or(PowerState::Unknown);
    room.rendererUdn = entry.rendererUdn.value_or(QString());
    room.zoneUdn = zoneUdn;

    // Duplicate names: the later room wins in name-keyed lookups.
    index.roomsByUdn.insert(room.udn, room);
    index.roomNameToUdn.insert(room.name, room.udn);
    index.roomNames.append(room.name);
}

} // namespace

HostInfo projectHostInfo(const HostInfoPayload& payload)
{
    HostInfo info;
    info.fields = payload.fields;
    return info;
}

ZoneIndex projectZoneConfig(const ZoneConfigPayload& payload)
{
    ZoneIndex index;

    for (const auto& zoneEntry : payload.zones) {
        Zone zone;
        zone.udn = zoneEntry.udn;
        QStringList names;
        for (const auto& roomEntry : zoneEntry.rooms) {
            addRoom(index, roomEntry, zoneEntry.udn);
            zone.roomUdns.append(roomEntry.udn);
            names.append(roomEntry.name);
        }
        names.sort();
        index.zones.append(zone);
        index.zoneRoomNames.append(names);
    }

    for (const auto& roomEntry : payload.unassignedRooms)
        addRoom(index, roomEntry, QString());

    return index;
}

DeviceDirectory projectDevices(const DeviceListPayload& payload)
{
    DeviceDirectory directory;
    for (const auto& entry : payload.devices) {
        Device device;
        device.udn = entry.udn;
        device.type = entry.type;
        device.kind = deviceKindFromType(entry.type);
        device.location = entry.location;
        device.displayName = entry.name;

        directory.devices.append(device);
        directory.devicesByUdn.insert(device.udn, device);
        if (device.kind == DeviceKind::MediaServer)
            directory.mediaServerUdn = device.udn;
    }
    return directory;
}

SystemState projectSystemState(const SystemStatePayload& payload)
{
    SystemState state;
    state.entries = payload.entries;
    const auto it = payload.entries.constFind(QStringLiteral("updateAvailable"));
    if (it != payload.entries.constEnd())
        state.updateAvailable = parseTruthy(it->value(QStringLiteral("value")));
    return state;
}

bool parseTruthy(const QString& value)
{
    static const QStringList truthy = {"true", "1", "t", "y", "yes"};
    return truthy.contains(value.trimmed().toLower());
}

} // namespace rlk
