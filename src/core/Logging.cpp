#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <string>

namespace rlk {

bool initLogging(const QString& level)
{
    namespace logging = boost::log;

    logging::trivial::severity_level severity = logging::trivial::info;
    const std::string name = level.trimmed().toLower().toStdString();
    const bool known = logging::trivial::from_string(name.c_str(), name.size(), severity);
    if (!known)
        severity = logging::trivial::info;

    logging::core::get()->set_filter(logging::trivial::severity >= severity);
    return known;
}

} // namespace rlk
