#include "LongPollTask.hpp"
#include "core/topology/Errors.hpp"
#include <boost/log/trivial.hpp>

namespace rlk {

LongPollTask::LongPollTask(ResourceKind kind, IResourceFetcher* fetcher, Applier applier,
                           int backoffMs, QObject* parent)
    : QObject(parent)
    , kind_(kind)
    , fetcher_(fetcher)
    , applier_(std::move(applier))
{
    backoffTimer_.setSingleShot(true);
    backoffTimer_.setInterval(backoffMs);
    connect(&backoffTimer_, &QTimer::timeout, this, &LongPollTask::poll);
}

LongPollTask::~LongPollTask()
{
    stop();
}

void LongPollTask::start()
{
    if (state_ != Idle && state_ != Stopped)
        return;
    BOOST_LOG_TRIVIAL(debug) << "[LongPollTask] starting " << resourceKindName(kind_).toStdString();
    poll();
}

void LongPollTask::stop()
{
    if (state_ == Idle || state_ == Stopped)
        return;
    backoffTimer_.stop();
    if (state_ == Polling)
        fetcher_->abort(kind_);
    setState(Stopped);
    BOOST_LOG_TRIVIAL(debug) << "[LongPollTask] stopped " << resourceKindName(kind_).toStdString();
}

void LongPollTask::poll()
{
    setState(Polling);
    fetcher_->fetch(kind_, cursor_, [this](const FetchResult& result) {
        onFetched(result);
    });
}

void LongPollTask::onFetched(const FetchResult& result)
{
    if (state_ != Polling)
        return;

    switch (result.status) {
    case FetchResult::Status::NotModified:
        poll();
        return;
    case FetchResult::Status::Failed:
        enterBackoff(result.error);
        return;
    case FetchResult::Status::Modified:
        if (result.cursor.isEmpty()) {
            // Polling on without a cursor would be answered at once, forever.
            enterBackoff(QStringLiteral("response without updateID"));
            return;
        }
        break;
    }

    setState(Applying);
    try {
        applier_(result.body);
    } catch (const PayloadError& e) {
        enterBackoff(QString::fromStdString(e.what()));
        return;
    }

    cursor_ = result.cursor;
    delivered_ = true;
    failures_ = 0;
    emit applied(kind_);

    // A receiver of applied() may have stopped the loop.
    if (state_ == Applying)
        poll();
}

void LongPollTask::enterBackoff(const QString& reason)
{
    ++failures_;
    // Log the first failure of a streak loudly, repeats quietly.
    if (failures_ == 1) {
        BOOST_LOG_TRIVIAL(warning) << "[LongPollTask] " << resourceKindName(kind_).toStdString()
                                   << " failed: " << reason.toStdString()
                                   << ", retrying in " << backoffTimer_.interval() << " ms";
    } else {
        BOOST_LOG_TRIVIAL(debug) << "[LongPollTask] " << resourceKindName(kind_).toStdString()
                                 << " failed again (" << failures_ << "): " << reason.toStdString();
    }
    setState(Backoff);
    backoffTimer_.start();
}

void LongPollTask::setState(State state)
{
    if (state_ == state)
        return;
    state_ = state;
    emit stateChanged(state);
}

} // namespace rlk
