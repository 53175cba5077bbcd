#pragma once

#include "core/topology/TopologyTypes.hpp"
#include <QHash>
#include <QMultiHash>
#include <QMutex>
#include <QObject>
#include <functional>

namespace rlk {

/// Observer registry for topology updates.
///
/// Each completed resource update is published once, tagged with the
/// resource kind and the version the store assigned to it. Subscribers are
/// invoked on the bus's thread via Qt::QueuedConnection; a subscription
/// removed before delivery is not invoked.
class UpdateBus : public QObject {
    Q_OBJECT
public:
    using Callback = std::function<void(ResourceKind kind, quint64 version)>;

    explicit UpdateBus(QObject* parent = nullptr);

    /// Returns a subscription id for unsubscribe(). Thread-safe.
    int subscribe(ResourceKind kind, Callback callback);

    /// Subscribe to updates of every resource kind. Thread-safe.
    int subscribeAll(Callback callback);

    /// Thread-safe; unknown ids are ignored.
    void unsubscribe(int subscriptionId);

    /// Thread-safe.
    void publish(ResourceKind kind, quint64 version);

    int subscriberCount() const;

private:
    static constexpr int kAnyResource = -1;

    struct Subscription {
        int topic = kAnyResource;
        Callback callback;
    };

    void deliver(int subscriptionId, ResourceKind kind, quint64 version);
    int add(int topic, Callback callback);

    mutable QMutex mutex_;
    int nextId_ = 1;
    QHash<int, Subscription> subscriptions_;
    QMultiHash<int, int> topicIndex_;
};

} // namespace rlk
