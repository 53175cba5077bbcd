#include "HttpTopologyService.hpp"
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <boost/log/trivial.hpp>

namespace rlk {

HttpTopologyService::HttpTopologyService(const QUrl& baseUrl, int requestTimeoutMs,
                                         QObject* parent)
    : QObject(parent)
    , network_(new QNetworkAccessManager(this))
    , baseUrl_(baseUrl)
    , requestTimeoutMs_(requestTimeoutMs)
{
}

void HttpTopologyService::connectRoomToZone(const QString& zoneUdn, const QString& roomUdn)
{
    QUrlQuery query;
    if (!zoneUdn.isEmpty())
        query.addQueryItem("zoneUDN", zoneUdn);
    if (!roomUdn.isEmpty())
        query.addQueryItem("roomUDN", roomUdn);
    sendRequest("/connectRoomToZone", query);
}

void HttpTopologyService::connectRoomsToZone(const QString& zoneUdn, const QStringList& roomUdns)
{
    QUrlQuery query;
    if (!zoneUdn.isEmpty())
        query.addQueryItem("zoneUDN", zoneUdn);
    if (!roomUdns.isEmpty())
        query.addQueryItem("roomUDNs", roomUdns.join(','));
    sendRequest("/connectRoomsToZone", query);
}

void HttpTopologyService::dropRoom(const QString& roomUdn)
{
    QUrlQuery query;
    query.addQueryItem("roomUDN", roomUdn);
    sendRequest("/dropRoomJob", query);
}

void HttpTopologyService::enterAutomaticStandby(const QString& roomUdn)
{
    QUrlQuery query;
    query.addQueryItem("roomUDN", roomUdn);
    sendRequest("/enterAutomaticStandby", query);
}

void HttpTopologyService::enterManualStandby(const QString& roomUdn)
{
    QUrlQuery query;
    query.addQueryItem("roomUDN", roomUdn);
    sendRequest("/enterManualStandby", query);
}

void HttpTopologyService::leaveStandby(const QString& roomUdn)
{
    QUrlQuery query;
    query.addQueryItem("roomUDN", roomUdn);
    sendRequest("/leaveStandby", query);
}

void HttpTopologyService::sendRequest(const QString& path, const QUrlQuery& query)
{
    QUrl url = baseUrl_;
    url.setPath(path);
    url.setQuery(query);

    BOOST_LOG_TRIVIAL(debug) << "[HttpTopologyService] GET " << url.toString().toStdString();

    QNetworkRequest request(url);
    if (requestTimeoutMs_ > 0)
        request.setTransferTimeout(requestTimeoutMs_);

    QNetworkReply* reply = network_->get(request);
    connect(reply, &QNetworkReply::finished, this, [this, reply, path]() {
        reply->deleteLater();
        const bool delivered = reply->error() == QNetworkReply::NoError;
        if (!delivered) {
            BOOST_LOG_TRIVIAL(warning) << "[HttpTopologyService] " << path.toStdString()
                                       << " failed: " << reply->errorString().toStdString();
        }
        emit requestFinished(path, delivered);
    });
}

} // namespace rlk
