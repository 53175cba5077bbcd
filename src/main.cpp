#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QUrl>
#include <yaml-cpp/exceptions.h>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/sync/HostCheck.hpp"
#include "core/sync/HttpResourceFetcher.hpp"
#include "core/sync/StateSynchronizer.hpp"
#include "core/topology/ZoneResolver.hpp"

namespace {

void logTopology(const rlk::ZoneResolver& resolver, rlk::ResourceKind kind, quint64 version)
{
    switch (kind) {
    case rlk::ResourceKind::HostInfo:
        qInfo() << "Host:" << resolver.hostName() << "in room" << resolver.hostRoom()
                << "version" << version;
        break;
    case rlk::ResourceKind::ZoneConfig:
        for (const auto& zone : resolver.zones())
            qInfo() << "Zone:" << zone.join(", ");
        qInfo() << "Rooms:" << resolver.rooms().join(", ") << "version" << version;
        break;
    case rlk::ResourceKind::Devices:
        qInfo() << "Devices updated, media server at"
                << resolver.mediaServerLocation().value_or(QStringLiteral("<none>"))
                << "version" << version;
        break;
    case rlk::ResourceKind::SystemState:
        qInfo() << "System state: update available =" << resolver.updateAvailable()
                << "version" << version;
        break;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("raumlink");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Keeps a live view of a multi-room audio host's topology.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption hostOption("host", "Host address (overrides config).", "address");
    QCommandLineOption portOption("port", "Host web service port (overrides config).", "port");
    QCommandLineOption configOption("config", "Path to the YAML config file.", "file",
                                    QDir::homePath() + "/.config/raumlink/config.yaml");
    parser.addOption(hostOption);
    parser.addOption(portOption);
    parser.addOption(configOption);
    parser.process(app);

    // Built-in defaults unless a config file exists
    rlk::YamlConfig config;
    const QString configPath = parser.value(configOption);
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
            qInfo() << "Config: loaded" << configPath;
        } catch (const YAML::Exception& e) {
            qCritical() << "Config: cannot load" << configPath << "-" << e.what();
            return 1;
        }
    }

    if (parser.isSet(hostOption))
        config.setHostAddress(parser.value(hostOption));
    if (parser.isSet(portOption)) {
        bool ok = false;
        const uint port = parser.value(portOption).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            qCritical() << "Invalid port" << parser.value(portOption);
            return 1;
        }
        config.setHostPort(static_cast<uint16_t>(port));
    }

    if (!rlk::initLogging(config.logLevel()))
        qWarning() << "Unknown log level" << config.logLevel() << "- using info";

    if (config.hostAddress().isEmpty()) {
        qCritical() << "No host address; set host.address in" << configPath << "or pass --host";
        return 1;
    }

    QUrl baseUrl;
    baseUrl.setScheme("http");
    baseUrl.setHost(config.hostAddress());
    baseUrl.setPort(config.hostPort());

    if (!rlk::verifyHost(baseUrl, config.hostVerifyTimeoutMs())) {
        qCritical() << "No multi-room host answering at" << baseUrl.toString();
        return 1;
    }

    rlk::HttpResourceFetcher fetcher(baseUrl, config.preferredWaitSeconds(),
                                     config.requestTimeoutMs());
    rlk::StateSynchronizer sync(&fetcher, config.failureBackoffMs());
    rlk::ZoneResolver resolver(sync.store());

    sync.updates().subscribeAll([&resolver](rlk::ResourceKind kind, quint64 version) {
        logTopology(resolver, kind, version);
    });

    qInfo() << "Connecting to" << baseUrl.toString();
    sync.start();
    if (!sync.waitForReady(config.readyTimeoutMs()))
        qWarning() << "Topology not complete after" << config.readyTimeoutMs()
                   << "ms, continuing to poll";

    // SIGINT/SIGTERM → stop polling and leave the event loop
    static rlk::StateSynchronizer* g_sync = &sync;
    auto onSignal = [](int) {
        QMetaObject::invokeMethod(g_sync, []() {
            g_sync->stop();
            QCoreApplication::quit();
        }, Qt::QueuedConnection);
    };
    signal(SIGINT, onSignal);
    signal(SIGTERM, onSignal);

    return app.exec();
}
