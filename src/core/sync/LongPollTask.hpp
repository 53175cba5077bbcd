#pragma once

#include "IResourceFetcher.hpp"
#include <QObject>
#include <QTimer>
#include <functional>

namespace rlk {

/// One resource's synchronization loop.
///
///   Polling  --200-->  Applying --> Polling
///   Polling  --304-->  Polling
///   Polling  --error-> Backoff  --delay--> Polling
///
/// The loop never ends on its own; only stop() leaves it. A payload the
/// applier rejects (PayloadError) is handled like a transport error and the
/// cursor is not advanced.
class LongPollTask : public QObject {
    Q_OBJECT
public:
    enum State { Idle, Polling, Applying, Backoff, Stopped };
    Q_ENUM(State)

    /// Decodes and projects a payload body into the store.
    using Applier = std::function<void(const QByteArray& body)>;

    LongPollTask(ResourceKind kind, IResourceFetcher* fetcher, Applier applier,
                 int backoffMs, QObject* parent = nullptr);
    ~LongPollTask() override;

    void start();
    void stop();

    ResourceKind kind() const { return kind_; }
    State state() const { return state_; }
    QString cursor() const { return cursor_; }
    bool hasDelivered() const { return delivered_; }
    int failureCount() const { return failures_; }

signals:
    void stateChanged(rlk::LongPollTask::State state);
    void applied(rlk::ResourceKind kind);

private:
    void poll();
    void onFetched(const FetchResult& result);
    void enterBackoff(const QString& reason);
    void setState(State state);

    ResourceKind kind_;
    IResourceFetcher* fetcher_;
    Applier applier_;
    QTimer backoffTimer_;
    State state_ = Idle;
    QString cursor_;
    bool delivered_ = false;
    int failures_ = 0;
};

} // namespace rlk
