#include "HostCheck.hpp"
#include "core/topology/Errors.hpp"
#include "core/topology/PayloadDecoder.hpp"
#include "core/topology/TopologyTypes.hpp"
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <boost/log/trivial.hpp>
#include <memory>

namespace rlk {

bool verifyHost(const QUrl& baseUrl, int timeoutMs)
{
    QUrl url = baseUrl;
    url.setPath(resourcePath(ResourceKind::HostInfo));

    QNetworkRequest request(url);
    if (timeoutMs > 0)
        request.setTransferTimeout(timeoutMs);

    QNetworkAccessManager network;
    std::unique_ptr<QNetworkReply> reply(network.get(request));

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished())
        loop.exec();

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (reply->error() != QNetworkReply::NoError || status != 200) {
        BOOST_LOG_TRIVIAL(warning) << "[HostCheck] " << url.toString().toStdString()
                                   << " unreachable: "
                                   << (reply->error() != QNetworkReply::NoError
                                           ? reply->errorString().toStdString()
                                           : "HTTP status " + std::to_string(status));
        return false;
    }

    try {
        const HostInfoPayload payload = decodeHostInfo(reply->readAll());
        if (!payload.fields.contains(QStringLiteral("hostName"))) {
            BOOST_LOG_TRIVIAL(warning) << "[HostCheck] host info without hostName";
            return false;
        }
        BOOST_LOG_TRIVIAL(info) << "[HostCheck] found host "
                                << payload.fields.value(QStringLiteral("hostName")).toStdString();
        return true;
    } catch (const PayloadError& e) {
        BOOST_LOG_TRIVIAL(warning) << "[HostCheck] bad host info: " << e.what();
        return false;
    }
}

} // namespace rlk
