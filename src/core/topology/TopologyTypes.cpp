#include "TopologyTypes.hpp"

namespace rlk {

QString resourceKindName(ResourceKind kind)
{
    switch (kind) {
    case ResourceKind::HostInfo: return QStringLiteral("host-info");
    case ResourceKind::ZoneConfig: return QStringLiteral("zone-config");
    case ResourceKind::Devices: return QStringLiteral("devices");
    case ResourceKind::SystemState: return QStringLiteral("system-state");
    }
    return QStringLiteral("unknown");
}

QString resourcePath(ResourceKind kind)
{
    switch (kind) {
    case ResourceKind::HostInfo: return QStringLiteral("/getHostInfo");
    case ResourceKind::ZoneConfig: return QStringLiteral("/getZones");
    case ResourceKind::Devices: return QStringLiteral("/listDevices");
    case ResourceKind::SystemState: return QStringLiteral("/SystemStateChannel");
    }
    return {};
}

PowerState powerStateFromString(const QString& value)
{
    const QString v = value.trimmed().toUpper();
    if (v == "ACTIVE" || v == "ON")
        return PowerState::On;
    if (v == "AUTOMATIC_STANDBY" || v == "MANUAL_STANDBY" || v == "STANDBY")
        return PowerState::Standby;
    if (v == "OFF" || v == "INACTIVE")
        return PowerState::Off;
    return PowerState::Unknown;
}

QString powerStateName(PowerState state)
{
    switch (state) {
    case PowerState::On: return QStringLiteral("on");
    case PowerState::Off: return QStringLiteral("off");
    case PowerState::Standby: return QStringLiteral("standby");
    case PowerState::Unknown: break;
    }
    return QStringLiteral("unknown");
}

DeviceKind deviceKindFromType(const QString& upnpType)
{
    // urn:schemas-upnp-org:device:MediaServer:1
    const QStringList parts = upnpType.split(':');
    if (parts.size() >= 2) {
        const QString name = parts.at(parts.size() - 2);
        if (name == "MediaServer")
            return DeviceKind::MediaServer;
        if (name == "MediaRenderer")
            return DeviceKind::ControllableSpeaker;
    }
    return DeviceKind::Other;
}

} // namespace rlk
