#pragma once

#include "IResourceFetcher.hpp"
#include <QObject>
#include <QPointer>
#include <QUrl>
#include <array>

class QNetworkAccessManager;
class QNetworkReply;

namespace rlk {

/// Long-polling over HTTP: GET <base>/<resource path> with
/// "Prefer: wait=N" and, once known, "updateID: <cursor>".
class HttpResourceFetcher : public QObject, public IResourceFetcher {
    Q_OBJECT
public:
    HttpResourceFetcher(const QUrl& baseUrl, int preferredWaitSeconds, int requestTimeoutMs,
                        QObject* parent = nullptr);
    ~HttpResourceFetcher() override;

    void fetch(ResourceKind kind, const QString& cursor, Callback callback) override;
    void abort(ResourceKind kind) override;

    QUrl baseUrl() const { return baseUrl_; }

private:
    QNetworkAccessManager* network_ = nullptr;
    QUrl baseUrl_;
    int preferredWaitSeconds_;
    int requestTimeoutMs_;
    std::array<QPointer<QNetworkReply>, kResourceKindCount> inFlight_;
};

} // namespace rlk
