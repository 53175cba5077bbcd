#include "UpdateBus.hpp"
#include <QMetaObject>
#include <algorithm>

namespace rlk {

UpdateBus::UpdateBus(QObject* parent) : QObject(parent) {}

int UpdateBus::subscribe(ResourceKind kind, Callback callback)
{
    return add(resourceIndex(kind), std::move(callback));
}

int UpdateBus::subscribeAll(Callback callback)
{
    return add(kAnyResource, std::move(callback));
}

int UpdateBus::add(int topic, Callback callback)
{
    QMutexLocker lock(&mutex_);
    const int id = nextId_++;
    subscriptions_.insert(id, Subscription{topic, std::move(callback)});
    topicIndex_.insert(topic, id);
    return id;
}

void UpdateBus::unsubscribe(int subscriptionId)
{
    QMutexLocker lock(&mutex_);
    auto it = subscriptions_.find(subscriptionId);
    if (it == subscriptions_.end())
        return;
    topicIndex_.remove(it->topic, subscriptionId);
    subscriptions_.erase(it);
}

void UpdateBus::publish(ResourceKind kind, quint64 version)
{
    QList<int> ids;
    {
        QMutexLocker lock(&mutex_);
        ids = topicIndex_.values(resourceIndex(kind));
        ids += topicIndex_.values(kAnyResource);
    }
    std::sort(ids.begin(), ids.end());

    for (int id : ids) {
        QMetaObject::invokeMethod(this, [this, id, kind, version]() {
            deliver(id, kind, version);
        }, Qt::QueuedConnection);
    }
}

void UpdateBus::deliver(int subscriptionId, ResourceKind kind, quint64 version)
{
    Callback callback;
    {
        QMutexLocker lock(&mutex_);
        auto it = subscriptions_.constFind(subscriptionId);
        if (it == subscriptions_.constEnd())
            return;
        callback = it->callback;  // run outside the lock, it may unsubscribe
    }
    callback(kind, version);
}

int UpdateBus::subscriberCount() const
{
    QMutexLocker lock(&mutex_);
    return static_cast<int>(subscriptions_.size());
}

} // namespace rlk
