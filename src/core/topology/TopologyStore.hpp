#pragma once

#include "TopologyTypes.hpp"
#include <QMutex>
#include <memory>

namespace rlk {

/// Versioned topology state, one immutable snapshot per resource.
///
/// Writers hand over a fully built subset; the store stamps a version and
/// swaps the pointer under the mutex. Readers get shared_ptr<const T> and
/// keep a consistent view for as long as they hold it. There is no
/// cross-subset transaction: a zone index and a device directory obtained
/// separately may come from different moments.
///
/// Thread-safe.
class TopologyStore {
public:
    TopologyStore();

    std::shared_ptr<const HostInfo> hostInfo() const;
    std::shared_ptr<const ZoneIndex> zoneIndex() const;
    std::shared_ptr<const DeviceDirectory> deviceDirectory() const;
    std::shared_ptr<const SystemState> systemState() const;

    // Each replace returns the version assigned to the new subset.
    quint64 replaceHostInfo(HostInfo info);
    quint64 replaceZoneIndex(ZoneIndex index);
    quint64 replaceDeviceDirectory(DeviceDirectory directory);
    quint64 replaceSystemState(SystemState state);

    /// 0 until the first replace of that subset.
    quint64 version(ResourceKind kind) const;

private:
    mutable QMutex mutex_;
    quint64 lastVersion_ = 0;
    std::shared_ptr<const HostInfo> hostInfo_;
    std::shared_ptr<const ZoneIndex> zoneIndex_;
    std::shared_ptr<const DeviceDirectory> deviceDirectory_;
    std::shared_ptr<const SystemState> systemState_;
};

} // namespace rlk
