#pragma once

#include <QString>

namespace rlk {

/// Sets the Boost.Log severity filter from a config level name
/// (trace, debug, info, warning, error, fatal). Unknown names fall back
/// to info and return false.
bool initLogging(const QString& level);

} // namespace rlk
