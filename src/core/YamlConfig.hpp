#pragma once

#include <QString>
#include <QVariant>
#include <cstdint>
#include <yaml-cpp/yaml.h>

namespace rlk {

/// YAML-backed settings. Loaded files are deep-merged over built-in
/// defaults, so a file only needs the keys it changes.
class YamlConfig {
public:
    YamlConfig();

    /// Throws YAML::Exception when the file cannot be read or parsed.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    // Host
    QString hostAddress() const;
    void setHostAddress(const QString& v);
    uint16_t hostPort() const;
    void setHostPort(uint16_t v);
    int hostVerifyTimeoutMs() const;
    void setHostVerifyTimeoutMs(int v);

    // Long-polling
    int preferredWaitSeconds() const;
    void setPreferredWaitSeconds(int v);
    int failureBackoffMs() const;
    void setFailureBackoffMs(int v);
    int requestTimeoutMs() const;
    void setRequestTimeoutMs(int v);
    int readyTimeoutMs() const;
    void setReadyTimeoutMs(int v);

    // Topology actions
    int actionTimeoutMs() const;
    void setActionTimeoutMs(int v);
    int actionPollIntervalMs() const;
    void setActionPollIntervalMs(int v);

    // Snapshots
    int maxTransportRetries() const;
    void setMaxTransportRetries(int v);
    int transportPollMs() const;
    void setTransportPollMs(int v);

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

    /// Dot-path lookup, e.g. "sync.preferred_wait_s". Invalid QVariant when absent.
    QVariant valueByPath(const QString& dottedKey) const;

private:
    YAML::Node root_;

    static YAML::Node buildDefaults();
};

} // namespace rlk
