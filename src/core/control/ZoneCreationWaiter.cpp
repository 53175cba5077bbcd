#include "ZoneCreationWaiter.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace rlk {

ZoneCreationWaiter::ZoneCreationWaiter(const ZoneResolver& resolver, int actionTimeoutMs,
                                       int pollIntervalMs)
    : resolver_(resolver)
    , actionTimeoutMs_(std::max(0, actionTimeoutMs))
    , pollIntervalMs_(std::max(1, pollIntervalMs))
{
}

int ZoneCreationWaiter::maxAttempts() const
{
    return std::max(1, (actionTimeoutMs_ + pollIntervalMs_ - 1) / pollIntervalMs_);
}

bool ZoneCreationWaiter::wait(const std::optional<QString>& oldZoneId,
                              const QStringList& targetRoomUdns)
{
    const int attempts = maxAttempts();
    lastAttempts_ = 0;
    sleeper_.reset();

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        lastAttempts_ = attempt;
        if (settled(oldZoneId, targetRoomUdns)) {
            BOOST_LOG_TRIVIAL(debug) << "[ZoneCreationWaiter] zone settled after "
                                     << attempt << " attempt(s)";
            return true;
        }
        if (attempt == attempts)
            break;
        if (!sleeper_.sleep(pollIntervalMs_)) {
            BOOST_LOG_TRIVIAL(debug) << "[ZoneCreationWaiter] cancelled";
            return false;
        }
    }

    BOOST_LOG_TRIVIAL(info) << "[ZoneCreationWaiter] zone for ["
                            << targetRoomUdns.join(", ").toStdString()
                            << "] not observed within " << actionTimeoutMs_ << " ms";
    return false;
}

bool ZoneCreationWaiter::settled(const std::optional<QString>& oldZoneId,
                                 const QStringList& targetRoomUdns) const
{
    const auto zoneId = resolver_.roomUdnsToZoneId(targetRoomUdns);
    if (!zoneId)
        return false;
    if (oldZoneId && *zoneId == *oldZoneId)
        return false;
    return resolver_.deviceLocation(*zoneId).has_value();
}

} // namespace rlk
