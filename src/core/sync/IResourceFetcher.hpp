#pragma once

#include "core/topology/TopologyTypes.hpp"
#include <QByteArray>
#include <QString>
#include <functional>

namespace rlk {

struct FetchResult {
    enum class Status {
        Modified,     // new content and a new cursor
        NotModified,  // host answered 304, keep the cursor
        Failed,       // any other status, network error or timeout
    };

    Status status = Status::Failed;
    QByteArray body;
    QString cursor;
    QString error;
};

/// Issues one long-poll request per call against a resource endpoint.
class IResourceFetcher {
public:
    virtual ~IResourceFetcher() = default;

    using Callback = std::function<void(const FetchResult& result)>;

    /// Start a request for kind, carrying cursor when non-empty.
    /// The callback runs exactly once, on the fetcher's thread, unless the
    /// request is aborted first. At most one request per kind is in flight.
    virtual void fetch(ResourceKind kind, const QString& cursor, Callback callback) = 0;

    /// Abandon the in-flight request for kind. Its callback is never invoked.
    virtual void abort(ResourceKind kind) = 0;
};

} // namespace rlk
