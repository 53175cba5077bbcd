#pragma once

#include <QString>

namespace rlk {

struct MediaInfo {
    int numberOfTracks = 0;
    QString mediaDuration;
    QString currentUri;
    QString currentUriMetaData;
};

struct PositionInfo {
    int track = 0;
    QString trackDuration;
    QString trackMetaData;
    QString trackUri;
    QString relTime;
    QString absTime;
};

struct TransportInfo {
    QString state;    // PLAYING, STOPPED, PAUSED_PLAYBACK, TRANSITIONING, ...
    QString status;
    QString speed;
};

struct TransportSettings {
    QString playMode;
    QString recQualityMode;
};

inline const QString kTransportTransitioning = QStringLiteral("TRANSITIONING");
inline const QString kSeekAbsTime = QStringLiteral("ABS_TIME");

/// Playback, volume and transport actions on a renderer device.
/// Every call is addressed by the device location (URL of its description).
/// Implementations throw RendererControlError when an action fails.
class IRendererControl {
public:
    virtual ~IRendererControl() = default;

    virtual bool mute(const QString& location) = 0;
    virtual void setMute(const QString& location, bool mute) = 0;

    virtual int volume(const QString& location) = 0;
    virtual void setVolume(const QString& location, int volume) = 0;
    virtual void changeVolume(const QString& location, int amount) = 0;
    virtual void setRoomVolume(const QString& location, const QString& roomUdn, int volume) = 0;

    virtual TransportSettings transportSettings(const QString& location) = 0;
    virtual void setPlayMode(const QString& location, const QString& playMode) = 0;

    virtual void play(const QString& location) = 0;
    virtual void pause(const QString& location) = 0;
    virtual void stop(const QString& location) = 0;
    virtual void next(const QString& location) = 0;
    virtual void previous(const QString& location) = 0;
    virtual void seek(const QString& location, const QString& unit, const QString& target) = 0;

    virtual void setTransportUri(const QString& location, const QString& uri,
                                 const QString& metaData) = 0;

    virtual MediaInfo mediaInfo(const QString& location) = 0;
    virtual PositionInfo positionInfo(const QString& location) = 0;
    virtual TransportInfo transportInfo(const QString& location) = 0;
};

} // namespace rlk
