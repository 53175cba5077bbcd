#pragma once

#include <QUrl>

namespace rlk {

/// Checks that baseUrl answers like a multi-room host: GET /getHostInfo
/// returns 200 with a host-info document that names the host.
///
/// Blocks in a local event loop for at most timeoutMs (no limit when <= 0).
/// Any failure, including an unreadable body, yields false.
bool verifyHost(const QUrl& baseUrl, int timeoutMs);

} // namespace rlk
