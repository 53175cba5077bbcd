#include "StateSynchronizer.hpp"
#include "core/topology/PayloadDecoder.hpp"
#include "core/topology/Projectors.hpp"
#include <QEventLoop>
#include <QTimer>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace rlk {

StateSynchronizer::StateSynchronizer(IResourceFetcher* fetcher, int failureBackoffMs, QObject* parent)
    : QObject(parent)
{
    for (ResourceKind kind : kAllResourceKinds) {
        auto* task = new LongPollTask(kind, fetcher,
            [this, kind](const QByteArray& body) { applyPayload(kind, body); },
            failureBackoffMs, this);
        connect(task, &LongPollTask::applied, this, &StateSynchronizer::onApplied);
        tasks_[resourceIndex(kind)] = task;
    }
}

StateSynchronizer::~StateSynchronizer()
{
    stop();
}

void StateSynchronizer::start()
{
    if (running_)
        return;
    running_ = true;
    BOOST_LOG_TRIVIAL(info) << "[StateSynchronizer] starting long-polling";
    for (auto* task : tasks_)
        task->start();
}

void StateSynchronizer::stop()
{
    if (!running_)
        return;
    running_ = false;
    for (auto* task : tasks_)
        task->stop();
    BOOST_LOG_TRIVIAL(info) << "[StateSynchronizer] stopped";
    emit stopped();
}

bool StateSynchronizer::waitForReady(int timeoutMs)
{
    if (gateOpen_)
        return true;
    if (!running_)
        return false;

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    connect(this, &StateSynchronizer::ready, &loop, &QEventLoop::quit);
    connect(this, &StateSynchronizer::stopped, &loop, &QEventLoop::quit);
    connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    if (timeoutMs >= 0)
        timeout.start(timeoutMs);
    loop.exec();

    if (!gateOpen_) {
        BOOST_LOG_TRIVIAL(warning) << "[StateSynchronizer] not ready after waiting";
    }
    return gateOpen_;
}

void StateSynchronizer::applyPayload(ResourceKind kind, const QByteArray& body)
{
    // Decoding happens before the swap, so a bad payload leaves the store untouched.
    switch (kind) {
    case ResourceKind::HostInfo:
        store_.replaceHostInfo(projectHostInfo(decodeHostInfo(body)));
        break;
    case ResourceKind::ZoneConfig:
        store_.replaceZoneIndex(projectZoneConfig(decodeZoneConfig(body)));
        break;
    case ResourceKind::Devices:
        store_.replaceDeviceDirectory(projectDevices(decodeDeviceList(body)));
        break;
    case ResourceKind::SystemState:
        store_.replaceSystemState(projectSystemState(decodeSystemState(body)));
        break;
    }
}

void StateSynchronizer::onApplied(ResourceKind kind)
{
    const quint64 version = store_.version(kind);
    ready_[resourceIndex(kind)] = true;

    BOOST_LOG_TRIVIAL(debug) << "[StateSynchronizer] " << resourceKindName(kind).toStdString()
                             << " updated to version " << version;

    bus_.publish(kind, version);
    emit resourceUpdated(kind, version);

    if (!gateOpen_ && std::all_of(ready_.begin(), ready_.end(), [](bool r) { return r; })) {
        gateOpen_ = true;
        BOOST_LOG_TRIVIAL(info) << "[StateSynchronizer] topology ready";
        emit ready();
    }
}

} // namespace rlk
