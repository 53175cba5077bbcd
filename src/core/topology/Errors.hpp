#pragma once

#include <QString>
#include <QStringList>
#include <stdexcept>

namespace rlk {

/// A room name that is not present in the current zone index.
class UnknownRoomError : public std::runtime_error {
public:
    explicit UnknownRoomError(const QString& roomName)
        : std::runtime_error("unknown room '" + roomName.toStdString() + "'")
        , roomName_(roomName)
    {
    }

    QString roomName() const { return roomName_; }

private:
    QString roomName_;
};

/// Raised only where an operation cannot continue without a zone.
/// Plain lookups report a missing zone as std::nullopt instead.
class ZoneNotFoundError : public std::runtime_error {
public:
    explicit ZoneNotFoundError(const QStringList& roomNames)
        : std::runtime_error("no zone for rooms [" + roomNames.join(", ").toStdString() + "]")
    {
    }
};

/// Malformed or unexpected payload from the host.
class PayloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Failure reported by a Renderer Control implementation.
class RendererControlError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace rlk
