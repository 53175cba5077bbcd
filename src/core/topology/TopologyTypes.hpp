#pragma once

#include <QHash>
#include <QList>
#include <QMap>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <array>
#include <cstdint>

namespace rlk {

/// The four long-polled resources of the host.
enum class ResourceKind {
    HostInfo = 0,
    ZoneConfig = 1,
    Devices = 2,
    SystemState = 3,
};

constexpr int kResourceKindCount = 4;

constexpr std::array<ResourceKind, kResourceKindCount> kAllResourceKinds = {
    ResourceKind::HostInfo,
    ResourceKind::ZoneConfig,
    ResourceKind::Devices,
    ResourceKind::SystemState,
};

inline int resourceIndex(ResourceKind kind) { return static_cast<int>(kind); }

QString resourceKindName(ResourceKind kind);

/// Path of the long-polling endpoint, e.g. "/getZones".
QString resourcePath(ResourceKind kind);

enum class PowerState { On, Off, Standby, Unknown };

/// Maps host power strings (ACTIVE, MANUAL_STANDBY, ...) to PowerState.
/// Unrecognised values map to Unknown.
PowerState powerStateFromString(const QString& value);
QString powerStateName(PowerState state);

enum class DeviceKind { MediaServer, ControllableSpeaker, Other };

DeviceKind deviceKindFromType(const QString& upnpType);

struct Device {
    QString udn;
    DeviceKind kind = DeviceKind::Other;
    QString type;          // raw UPnP device type
    QString location;      // URL of the device description
    QString displayName;
};

struct Room {
    QString name;
    QString udn;
    PowerState powerState = PowerState::Unknown;
    QString rendererUdn;   // empty when the host did not report one
    QString zoneUdn;       // empty for unassigned rooms
};

struct Zone {
    QString udn;
    QStringList roomUdns;  // payload order
};

/// Rooms and zones as of one zone-config update.
struct ZoneIndex {
    quint64 version = 0;
    QList<Zone> zones;
    QHash<QString, Room> roomsByUdn;
    QHash<QString, QString> roomNameToUdn;
    QStringList roomNames;              // zone rooms first, then unassigned
    QList<QStringList> zoneRoomNames;   // sorted names, one entry per zone
};

struct HostInfo {
    quint64 version = 0;
    QMap<QString, QString> fields;

    QString hostName() const { return fields.value(QStringLiteral("hostName")); }
    QString roomName() const { return fields.value(QStringLiteral("roomName")); }
};

struct DeviceDirectory {
    quint64 version = 0;
    QList<Device> devices;
    QHash<QString, Device> devicesByUdn;
    QString mediaServerUdn;
};

struct SystemState {
    quint64 version = 0;
    QMap<QString, QMap<QString, QString>> entries;  // element -> attributes
    bool updateAvailable = false;
};

} // namespace rlk

Q_DECLARE_METATYPE(rlk::ResourceKind)
