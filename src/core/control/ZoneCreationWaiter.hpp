#pragma once

#include "CancellableWait.hpp"
#include "core/topology/ZoneResolver.hpp"
#include <optional>

namespace rlk {

/// Waits for a zone mutation request to show up in the topology.
///
/// Polls the resolver every pollIntervalMs, at most
/// ceil(actionTimeoutMs / pollIntervalMs) times, until a zone with exactly
/// the target rooms exists, its id differs from the pre-mutation id and the
/// id has a device location. Giving up is silent; callers re-check the
/// topology themselves.
class ZoneCreationWaiter {
public:
    ZoneCreationWaiter(const ZoneResolver& resolver, int actionTimeoutMs, int pollIntervalMs);

    int maxAttempts() const;

    /// true once the new zone was observed, false when attempts ran out or
    /// the wait was cancelled. Either way the wait is only best effort.
    bool wait(const std::optional<QString>& oldZoneId, const QStringList& targetRoomUdns);

    /// Interrupts a running wait(). The next wait() starts afresh.
    void cancel() { sleeper_.cancel(); }

    int lastAttempts() const { return lastAttempts_; }

private:
    bool settled(const std::optional<QString>& oldZoneId, const QStringList& targetRoomUdns) const;

    const ZoneResolver& resolver_;
    int actionTimeoutMs_;
    int pollIntervalMs_;
    int lastAttempts_ = 0;
    CancellableWait sleeper_;
};

} // namespace rlk
