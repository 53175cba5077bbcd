#pragma once

#include <QByteArray>
#include <QFile>
#include <QList>
#include <QObject>
#include <QPair>
#include <QQueue>
#include <QStringList>
#include <QTimer>
#include <array>
#include <functional>
#include "core/control/IRendererControl.hpp"
#include "core/control/ITopologyService.hpp"
#include "core/sync/IResourceFetcher.hpp"
#include "core/topology/Errors.hpp"
#include "core/topology/Payloads.hpp"
#include "core/topology/Projectors.hpp"
#include "core/topology/TopologyStore.hpp"

// Shared fakes and payload builders for the test suite.

namespace testing {

inline QByteArray readFixture(const QString& name)
{
    QFile file(QString(TEST_DATA_DIR) + "/" + name);
    if (!file.open(QIODevice::ReadOnly))
        return {};
    return file.readAll();
}

// Room "Kitchen" gets udn "uuid:room-kitchen".
inline QString roomUdnFor(const QString& name)
{
    return "uuid:room-" + name.toLower();
}

inline rlk::RoomEntry roomEntry(const QString& name,
                                std::optional<rlk::PowerState> power = std::nullopt)
{
    rlk::RoomEntry room;
    room.name = name;
    room.udn = roomUdnFor(name);
    room.powerState = power;
    return room;
}

inline rlk::ZoneEntry zoneEntry(const QString& zoneUdn, const QStringList& roomNames)
{
    rlk::ZoneEntry zone;
    zone.udn = zoneUdn;
    for (const auto& name : roomNames)
        zone.rooms.append(roomEntry(name, rlk::PowerState::On));
    return zone;
}

inline rlk::DeviceEntry rendererDevice(const QString& udn, const QString& location)
{
    rlk::DeviceEntry device;
    device.udn = udn;
    device.type = QStringLiteral("urn:schemas-upnp-org:device:MediaRenderer:1");
    device.location = location;
    device.name = udn;
    return device;
}

/// Replace the store's zone index with the given zones plus unassigned rooms.
inline void setZones(rlk::TopologyStore& store, const QList<rlk::ZoneEntry>& zones,
                     const QStringList& unassigned = {})
{
    rlk::ZoneConfigPayload payload;
    payload.zones = zones;
    for (const auto& name : unassigned)
        payload.unassignedRooms.append(roomEntry(name));
    store.replaceZoneIndex(rlk::projectZoneConfig(payload));
}

/// Replace the device directory with one renderer per (udn, location) pair.
inline void setDevices(rlk::TopologyStore& store, const QList<QPair<QString, QString>>& renderers)
{
    rlk::DeviceListPayload payload;
    for (const auto& r : renderers)
        payload.devices.append(rendererDevice(r.first, r.second));
    store.replaceDeviceDirectory(rlk::projectDevices(payload));
}

inline rlk::FetchResult modified(const QByteArray& body, const QString& cursor)
{
    rlk::FetchResult result;
    result.status = rlk::FetchResult::Status::Modified;
    result.body = body;
    result.cursor = cursor;
    return result;
}

inline rlk::FetchResult notModified()
{
    rlk::FetchResult result;
    result.status = rlk::FetchResult::Status::NotModified;
    return result;
}

inline rlk::FetchResult failed(const QString& error = QStringLiteral("connection refused"))
{
    rlk::FetchResult result;
    result.status = rlk::FetchResult::Status::Failed;
    result.error = error;
    return result;
}

/// Scripted fetcher. Responses queued per kind are handed out in order,
/// one per request, from the event loop. A request with an empty script
/// stays pending until a response is queued or it is aborted.
class FakeResourceFetcher : public rlk::IResourceFetcher {
public:
    void enqueue(rlk::ResourceKind kind, const rlk::FetchResult& result)
    {
        const int i = rlk::resourceIndex(kind);
        scripts_[i].enqueue(result);
        if (pending_[i])
            schedule(i);
    }

    void fetch(rlk::ResourceKind kind, const QString& cursor, Callback callback) override
    {
        const int i = rlk::resourceIndex(kind);
        ++fetchCount[i];
        cursors[i].append(cursor);
        pending_[i] = std::move(callback);
        ++generation_[i];
        if (!scripts_[i].isEmpty())
            schedule(i);
    }

    void abort(rlk::ResourceKind kind) override
    {
        const int i = rlk::resourceIndex(kind);
        ++abortCount[i];
        pending_[i] = nullptr;
        ++generation_[i];
    }

    bool isPending(rlk::ResourceKind kind) const
    {
        return static_cast<bool>(pending_[rlk::resourceIndex(kind)]);
    }

    int fetches(rlk::ResourceKind kind) const { return fetchCount[rlk::resourceIndex(kind)]; }
    int aborts(rlk::ResourceKind kind) const { return abortCount[rlk::resourceIndex(kind)]; }
    QStringList cursorsSent(rlk::ResourceKind kind) const { return cursors[rlk::resourceIndex(kind)]; }

    std::array<int, rlk::kResourceKindCount> fetchCount{};
    std::array<int, rlk::kResourceKindCount> abortCount{};
    std::array<QStringList, rlk::kResourceKindCount> cursors;

private:
    void schedule(int i)
    {
        const int generation = generation_[i];
        QTimer::singleShot(0, &context_, [this, i, generation]() {
            if (generation != generation_[i] || !pending_[i] || scripts_[i].isEmpty())
                return;
            Callback callback = std::move(pending_[i]);
            pending_[i] = nullptr;
            callback(scripts_[i].dequeue());
        });
    }

    QObject context_;
    std::array<Callback, rlk::kResourceKindCount> pending_;
    std::array<int, rlk::kResourceKindCount> generation_{};
    std::array<QQueue<rlk::FetchResult>, rlk::kResourceKindCount> scripts_;
};

/// Single in-memory renderer. Records every call as "name(args)".
class FakeRendererControl : public rlk::IRendererControl {
public:
    bool mute(const QString& location) override
    {
        record("mute(" + location + ")");
        return muted;
    }
    void setMute(const QString& location, bool m) override
    {
        record(QString("setMute(%1,%2)").arg(location).arg(m ? "1" : "0"));
        muted = m;
    }
    int volume(const QString& location) override
    {
        record("volume(" + location + ")");
        return currentVolume;
    }
    void setVolume(const QString& location, int v) override
    {
        record(QString("setVolume(%1,%2)").arg(location).arg(v));
        currentVolume = v;
    }
    void changeVolume(const QString& location, int amount) override
    {
        record(QString("changeVolume(%1,%2)").arg(location).arg(amount));
        currentVolume += amount;
    }
    void setRoomVolume(const QString& location, const QString& roomUdn, int v) override
    {
        record(QString("setRoomVolume(%1,%2,%3)").arg(location, roomUdn).arg(v));
    }
    rlk::TransportSettings transportSettings(const QString& location) override
    {
        record("transportSettings(" + location + ")");
        rlk::TransportSettings settings;
        settings.playMode = playMode;
        return settings;
    }
    void setPlayMode(const QString& location, const QString& mode) override
    {
        record(QString("setPlayMode(%1,%2)").arg(location, mode));
        playMode = mode;
    }
    void play(const QString& location) override { record("play(" + location + ")"); }
    void pause(const QString& location) override { record("pause(" + location + ")"); }
    void stop(const QString& location) override { record("stop(" + location + ")"); }
    void next(const QString& location) override { record("next(" + location + ")"); }
    void previous(const QString& location) override { record("previous(" + location + ")"); }
    void seek(const QString& location, const QString& unit, const QString& target) override
    {
        record(QString("seek(%1,%2,%3)").arg(location, unit, target));
        absTime = target;
    }
    void setTransportUri(const QString& location, const QString& u, const QString& metaData) override
    {
        record(QString("setTransportUri(%1,%2)").arg(location, u));
        uri = u;
        uriMetaData = metaData;
    }
    rlk::MediaInfo mediaInfo(const QString& location) override
    {
        record("mediaInfo(" + location + ")");
        rlk::MediaInfo info;
        info.numberOfTracks = 1;
        info.currentUri = uri;
        info.currentUriMetaData = uriMetaData;
        return info;
    }
    rlk::PositionInfo positionInfo(const QString& location) override
    {
        record("positionInfo(" + location + ")");
        rlk::PositionInfo info;
        info.track = 1;
        info.trackUri = uri;
        info.absTime = absTime;
        info.relTime = absTime;
        return info;
    }
    rlk::TransportInfo transportInfo(const QString& location) override
    {
        record("transportInfo(" + location + ")");
        rlk::TransportInfo info;
        // Scripted states first, then the steady state.
        info.state = transportStates.isEmpty() ? steadyTransportState : transportStates.takeFirst();
        info.status = QStringLiteral("OK");
        info.speed = QStringLiteral("1");
        return info;
    }

    /// Calls named here throw RendererControlError, e.g. "setTransportUri".
    void failOn(const QString& name) { failing_ = name; }

    QStringList callsNamed(const QString& name) const
    {
        QStringList result;
        for (const auto& call : calls) {
            if (call.startsWith(name + "("))
                result << call;
        }
        return result;
    }

    QStringList calls;
    bool muted = false;
    int currentVolume = 0;
    QString uri;
    QString uriMetaData;
    QString absTime;
    QString playMode = QStringLiteral("NORMAL");
    QStringList transportStates;
    QString steadyTransportState = QStringLiteral("PLAYING");

private:
    void record(const QString& call)
    {
        calls << call;
        if (!failing_.isEmpty() && call.startsWith(failing_ + "("))
            throw rlk::RendererControlError(failing_.toStdString() + " failed");
    }

    QString failing_;
};

/// Records requests; onConnect lets a test play the host and apply the change.
class FakeTopologyService : public rlk::ITopologyService {
public:
    void connectRoomToZone(const QString& zoneUdn, const QString& roomUdn) override
    {
        calls << QString("connectRoomToZone(%1,%2)").arg(zoneUdn, roomUdn);
        if (onConnect)
            onConnect(zoneUdn, QStringList{roomUdn});
    }
    void connectRoomsToZone(const QString& zoneUdn, const QStringList& roomUdns) override
    {
        calls << QString("connectRoomsToZone(%1,%2)").arg(zoneUdn, roomUdns.join(','));
        if (onConnect)
            onConnect(zoneUdn, roomUdns);
    }
    void dropRoom(const QString& roomUdn) override { calls << "dropRoom(" + roomUdn + ")"; }
    void enterAutomaticStandby(const QString& roomUdn) override
    {
        calls << "enterAutomaticStandby(" + roomUdn + ")";
    }
    void enterManualStandby(const QString& roomUdn) override
    {
        calls << "enterManualStandby(" + roomUdn + ")";
    }
    void leaveStandby(const QString& roomUdn) override { calls << "leaveStandby(" + roomUdn + ")"; }

    QStringList calls;
    std::function<void(const QString& zoneUdn, const QStringList& roomUdns)> onConnect;
};

} // namespace testing
