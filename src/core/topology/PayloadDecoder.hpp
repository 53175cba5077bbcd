#pragma once

#include "Payloads.hpp"
#include <QByteArray>

namespace rlk {

/// XML decoders for the four long-polled resources.
/// All of them throw PayloadError on malformed XML or an unexpected root element.

HostInfoPayload decodeHostInfo(const QByteArray& xml);
ZoneConfigPayload decodeZoneConfig(const QByteArray& xml);
DeviceListPayload decodeDeviceList(const QByteArray& xml);
SystemStatePayload decodeSystemState(const QByteArray& xml);

} // namespace rlk
