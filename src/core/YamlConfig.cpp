#include "core/YamlConfig.hpp"
#include <QStringList>
#include <fstream>

namespace rlk {

namespace {

// Overlay wins for scalars and sequences; maps merge key by key.
void mergeInto(YAML::Node target, const YAML::Node& overlay)
{
    if (!overlay.IsMap())
        return;
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (it->second.IsNull())
            continue;
        const std::string key = it->first.as<std::string>();
        YAML::Node existing = target[key];
        if (existing.IsMap() && it->second.IsMap())
            mergeInto(existing, it->second);
        else
            target[key] = YAML::Clone(it->second);
    }
}

} // namespace

YamlConfig::YamlConfig()
    : root_(buildDefaults())
{
}

YAML::Node YamlConfig::buildDefaults()
{
    YAML::Node root(YAML::NodeType::Map);

    root["host"]["address"] = "";
    root["host"]["port"] = 47365;
    root["host"]["verify_timeout_ms"] = 3000;

    root["sync"]["preferred_wait_s"] = 50;
    root["sync"]["failure_backoff_ms"] = 5000;
    root["sync"]["request_timeout_ms"] = 60000;
    root["sync"]["ready_timeout_ms"] = 30000;

    root["actions"]["timeout_ms"] = 10000;
    root["actions"]["poll_interval_ms"] = 100;

    root["snapshot"]["max_transport_retries"] = 10;
    root["snapshot"]["transport_poll_ms"] = 100;

    root["logging"]["level"] = "info";

    return root;
}

void YamlConfig::load(const QString& filePath)
{
    YAML::Node merged = buildDefaults();
    mergeInto(merged, YAML::LoadFile(filePath.toStdString()));
    root_ = merged;
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream out(filePath.toStdString());
    out << root_;
}

// --- Host ---

QString YamlConfig::hostAddress() const
{
    return QString::fromStdString(root_["host"]["address"].as<std::string>(""));
}

void YamlConfig::setHostAddress(const QString& v)
{
    root_["host"]["address"] = v.toStdString();
}

uint16_t YamlConfig::hostPort() const
{
    return root_["host"]["port"].as<uint16_t>(47365);
}

void YamlConfig::setHostPort(uint16_t v)
{
    root_["host"]["port"] = v;
}

int YamlConfig::hostVerifyTimeoutMs() const
{
    return root_["host"]["verify_timeout_ms"].as<int>(3000);
}

void YamlConfig::setHostVerifyTimeoutMs(int v)
{
    root_["host"]["verify_timeout_ms"] = v;
}

// --- Long-polling ---

int YamlConfig::preferredWaitSeconds() const
{
    return root_["sync"]["preferred_wait_s"].as<int>(50);
}

void YamlConfig::setPreferredWaitSeconds(int v)
{
    root_["sync"]["preferred_wait_s"] = v;
}

int YamlConfig::failureBackoffMs() const
{
    return root_["sync"]["failure_backoff_ms"].as<int>(5000);
}

void YamlConfig::setFailureBackoffMs(int v)
{
    root_["sync"]["failure_backoff_ms"] = v;
}

int YamlConfig::requestTimeoutMs() const
{
    return root_["sync"]["request_timeout_ms"].as<int>(60000);
}

void YamlConfig::setRequestTimeoutMs(int v)
{
    root_["sync"]["request_timeout_ms"] = v;
}

int YamlConfig::readyTimeoutMs() const
{
    return root_["sync"]["ready_timeout_ms"].as<int>(30000);
}

void YamlConfig::setReadyTimeoutMs(int v)
{
    root_["sync"]["ready_timeout_ms"] = v;
}

// --- Topology actions ---

int YamlConfig::actionTimeoutMs() const
{
    return root_["actions"]["timeout_ms"].as<int>(10000);
}

void YamlConfig::setActionTimeoutMs(int v)
{
    root_["actions"]["timeout_ms"] = v;
}

int YamlConfig::actionPollIntervalMs() const
{
    return root_["actions"]["poll_interval_ms"].as<int>(100);
}

void YamlConfig::setActionPollIntervalMs(int v)
{
    root_["actions"]["poll_interval_ms"] = v;
}

// --- Snapshots ---

int YamlConfig::maxTransportRetries() const
{
    return root_["snapshot"]["max_transport_retries"].as<int>(10);
}

void YamlConfig::setMaxTransportRetries(int v)
{
    root_["snapshot"]["max_transport_retries"] = v;
}

int YamlConfig::transportPollMs() const
{
    return root_["snapshot"]["transport_poll_ms"].as<int>(100);
}

void YamlConfig::setTransportPollMs(int v)
{
    root_["snapshot"]["transport_poll_ms"] = v;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    const QStringList parts = dottedKey.split('.', Qt::SkipEmptyParts);
    if (parts.isEmpty())
        return {};

    // Walk through const nodes: non-const operator[] would insert keys,
    // and Node::operator= would overwrite the referenced value.
    YAML::Node node;
    node.reset(root_);
    for (const auto& part : parts) {
        const YAML::Node& current = node;
        if (!current.IsMap())
            return {};
        const YAML::Node child = current[part.toStdString()];
        if (!child.IsDefined())
            return {};
        node.reset(child);
    }
    if (!node.IsScalar())
        return {};

    const std::string text = node.as<std::string>();
    if (text == "true" || text == "false")
        return QVariant(text == "true");
    bool ok = false;
    const int asInt = QString::fromStdString(text).toInt(&ok);
    if (ok)
        return QVariant(asInt);
    return QVariant(QString::fromStdString(text));
}

} // namespace rlk
