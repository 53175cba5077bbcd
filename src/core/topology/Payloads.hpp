#pragma once

#include "TopologyTypes.hpp"
#include <QList>
#include <QMap>
#include <QString>
#include <optional>

namespace rlk {

// Decoded host payloads. Attributes the host may omit are std::optional
// so projectors can tell "absent" from "empty".

struct RoomEntry {
    QString name;
    QString udn;
    std::optional<PowerState> powerState;
    std::optional<QString> rendererUdn;
};

struct ZoneEntry {
    QString udn;
    QList<RoomEntry> rooms;
};

struct ZoneConfigPayload {
    QList<ZoneEntry> zones;
    QList<RoomEntry> unassignedRooms;
};

struct DeviceEntry {
    QString udn;
    QString type;
    QString location;
    QString name;
};

struct DeviceListPayload {
    QList<DeviceEntry> devices;
};

struct HostInfoPayload {
    QMap<QString, QString> fields;
};

struct SystemStatePayload {
    QMap<QString, QMap<QString, QString>> entries;
};

} // namespace rlk
