#pragma once

#include "Payloads.hpp"
#include "TopologyTypes.hpp"

namespace rlk {

// Pure payload -> topology subset transformations. Each call builds a
// complete replacement; nothing is patched incrementally. The version field
// of the result is left at 0 and assigned by TopologyStore on replace.

HostInfo projectHostInfo(const HostInfoPayload& payload);
ZoneIndex projectZoneConfig(const ZoneConfigPayload& payload);
DeviceDirectory projectDevices(const DeviceListPayload& payload);
SystemState projectSystemState(const SystemStatePayload& payload);

/// "true", "1", "t", "y", "yes" in any case.
bool parseTruthy(const QString& value);

} // namespace rlk
