#pragma once

#include "ITopologyService.hpp"
#include <QObject>
#include <QUrl>
#include <QUrlQuery>

class QNetworkAccessManager;

namespace rlk {

/// ITopologyService over the host's web service (plain GET requests).
/// The response only tells whether the request was delivered; it says
/// nothing about whether the topology change took effect. A request still
/// unanswered after requestTimeoutMs is aborted and reported as undelivered.
class HttpTopologyService : public QObject, public ITopologyService {
    Q_OBJECT
public:
    HttpTopologyService(const QUrl& baseUrl, int requestTimeoutMs, QObject* parent = nullptr);

    void connectRoomToZone(const QString& zoneUdn, const QString& roomUdn) override;
    void connectRoomsToZone(const QString& zoneUdn, const QStringList& roomUdns) override;
    void dropRoom(const QString& roomUdn) override;
    void enterAutomaticStandby(const QString& roomUdn) override;
    void enterManualStandby(const QString& roomUdn) override;
    void leaveStandby(const QString& roomUdn) override;

signals:
    void requestFinished(const QString& path, bool delivered);

private:
    void sendRequest(const QString& path, const QUrlQuery& query = {});

    QNetworkAccessManager* network_ = nullptr;
    QUrl baseUrl_;
    int requestTimeoutMs_;
};

} // namespace rlk
