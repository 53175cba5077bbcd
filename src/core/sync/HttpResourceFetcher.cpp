#include "HttpResourceFetcher.hpp"
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <boost/log/trivial.hpp>

namespace rlk {

HttpResourceFetcher::HttpResourceFetcher(const QUrl& baseUrl, int preferredWaitSeconds,
                                         int requestTimeoutMs, QObject* parent)
    : QObject(parent)
    , network_(new QNetworkAccessManager(this))
    , baseUrl_(baseUrl)
    , preferredWaitSeconds_(preferredWaitSeconds)
    , requestTimeoutMs_(requestTimeoutMs)
{
}

HttpResourceFetcher::~HttpResourceFetcher()
{
    for (ResourceKind kind : kAllResourceKinds)
        abort(kind);
}

void HttpResourceFetcher::fetch(ResourceKind kind, const QString& cursor, Callback callback)
{
    abort(kind);

    QUrl url = baseUrl_;
    url.setPath(resourcePath(kind));

    QNetworkRequest request(url);
    request.setRawHeader("Prefer", "wait=" + QByteArray::number(preferredWaitSeconds_));
    if (!cursor.isEmpty())
        request.setRawHeader("updateID", cursor.toUtf8());
    if (requestTimeoutMs_ > 0)
        request.setTransferTimeout(requestTimeoutMs_);

    QNetworkReply* reply = network_->get(request);
    inFlight_[resourceIndex(kind)] = reply;

    connect(reply, &QNetworkReply::finished, this, [this, kind, reply, callback]() {
        if (inFlight_[resourceIndex(kind)] == reply)
            inFlight_[resourceIndex(kind)] = nullptr;
        reply->deleteLater();

        FetchResult result;
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (status == 200 && reply->error() == QNetworkReply::NoError) {
            result.status = FetchResult::Status::Modified;
            result.body = reply->readAll();
            result.cursor = QString::fromUtf8(reply->rawHeader("updateID"));
        } else if (status == 304) {
            result.status = FetchResult::Status::NotModified;
        } else {
            result.status = FetchResult::Status::Failed;
            result.error = reply->error() != QNetworkReply::NoError
                ? reply->errorString()
                : QStringLiteral("HTTP status %1").arg(status);
        }
        callback(result);
    });
}

void HttpResourceFetcher::abort(ResourceKind kind)
{
    QPointer<QNetworkReply> reply = inFlight_[resourceIndex(kind)];
    inFlight_[resourceIndex(kind)] = nullptr;
    if (!reply)
        return;

    BOOST_LOG_TRIVIAL(debug) << "[HttpResourceFetcher] aborting "
                             << resourceKindName(kind).toStdString() << " request";
    reply->disconnect(this);
    reply->abort();
    reply->deleteLater();
}

} // namespace rlk
