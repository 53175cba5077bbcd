#include "TopologyStore.hpp"

namespace rlk {

TopologyStore::TopologyStore()
    : hostInfo_(std::make_shared<const HostInfo>())
    , zoneIndex_(std::make_shared<const ZoneIndex>())
    , deviceDirectory_(std::make_shared<const DeviceDirectory>())
    , systemState_(std::make_shared<const SystemState>())
{
}

std::shared_ptr<const HostInfo> TopologyStore::hostInfo() const
{
    QMutexLocker lock(&mutex_);
    return hostInfo_;
}

std::shared_ptr<const ZoneIndex> TopologyStore::zoneIndex() const
{
    QMutexLocker lock(&mutex_);
    return zoneIndex_;
}

std::shared_ptr<const DeviceDirectory> TopologyStore::deviceDirectory() const
{
    QMutexLocker lock(&mutex_);
    return deviceDirectory_;
}

std::shared_ptr<const SystemState> TopologyStore::systemState() const
{
    QMutexLocker lock(&mutex_);
    return systemState_;
}

quint64 TopologyStore::replaceHostInfo(HostInfo info)
{
    QMutexLocker lock(&mutex_);
    info.version = ++lastVersion_;
    hostInfo_ = std::make_shared<const HostInfo>(std::move(info));
    return lastVersion_;
}

quint64 TopologyStore::replaceZoneIndex(ZoneIndex index)
{
    QMutexLocker lock(&mutex_);
    index.version = ++lastVersion_;
    zoneIndex_ = std::make_shared<const ZoneIndex>(std::move(index));
    return lastVersion_;
}

quint64 TopologyStore::replaceDeviceDirectory(DeviceDirectory directory)
{
    QMutexLocker lock(&mutex_);
    directory.version = ++lastVersion_;
    deviceDirectory_ = std::make_shared<const DeviceDirectory>(std::move(directory));
    return lastVersion_;
}

quint64 TopologyStore::replaceSystemState(SystemState state)
{
    QMutexLocker lock(&mutex_);
    state.version = ++lastVersion_;
    systemState_ = std::make_shared<const SystemState>(std::move(state));
    return lastVersion_;
}

quint64 TopologyStore::version(ResourceKind kind) const
{
    QMutexLocker lock(&mutex_);
    switch (kind) {
    case ResourceKind::HostInfo: return hostInfo_->version;
    case ResourceKind::ZoneConfig: return zoneIndex_->version;
    case ResourceKind::Devices: return deviceDirectory_->version;
    case ResourceKind::SystemState: return systemState_->version;
    }
    return 0;
}

} // namespace rlk
