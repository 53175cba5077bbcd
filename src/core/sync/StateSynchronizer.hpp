#pragma once

#include "LongPollTask.hpp"
#include "UpdateBus.hpp"
#include "core/topology/TopologyStore.hpp"
#include <QObject>
#include <array>

namespace rlk {

/// Keeps a TopologyStore in sync with the host.
///
/// Runs one LongPollTask per resource on this object's thread. Each applied
/// payload replaces its store subset, marks the resource ready and is
/// published on the update bus. The readiness gate opens once every
/// resource has been applied at least once.
///
/// The fetcher is not owned and must outlive the synchronizer.
class StateSynchronizer : public QObject {
    Q_OBJECT
public:
    explicit StateSynchronizer(IResourceFetcher* fetcher, int failureBackoffMs = 5000,
                               QObject* parent = nullptr);
    ~StateSynchronizer() override;

    /// Launch all four loops. Returns immediately; see waitForReady().
    void start();

    /// Abort in-flight requests and stop all loops. The store keeps the
    /// last applied state.
    void stop();

    /// Block in a local event loop until the readiness gate opens.
    /// Returns false on timeout (timeoutMs < 0 waits forever) or when
    /// stop() is called meanwhile.
    bool waitForReady(int timeoutMs = -1);

    bool isRunning() const { return running_; }
    bool isReady() const { return gateOpen_; }
    bool isReady(ResourceKind kind) const { return ready_[resourceIndex(kind)]; }

    const TopologyStore& store() const { return store_; }
    UpdateBus& updates() { return bus_; }
    LongPollTask* task(ResourceKind kind) const { return tasks_[resourceIndex(kind)]; }

signals:
    void resourceUpdated(rlk::ResourceKind kind, quint64 version);
    void ready();
    void stopped();

private:
    void applyPayload(ResourceKind kind, const QByteArray& body);
    void onApplied(ResourceKind kind);

    TopologyStore store_;
    UpdateBus bus_;
    std::array<LongPollTask*, kResourceKindCount> tasks_{};
    std::array<bool, kResourceKindCount> ready_{};
    bool gateOpen_ = false;
    bool running_ = false;
};

} // namespace rlk
