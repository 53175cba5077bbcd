#include "PayloadDecoder.hpp"
#include "Errors.hpp"
#include <QXmlStreamReader>

namespace rlk {

namespace {

void enterRoot(QXmlStreamReader& reader, const char* rootName)
{
    if (!reader.readNextStartElement()) {
        throw PayloadError(std::string("empty payload, expected <") + rootName + ">: "
                           + reader.errorString().toStdString());
    }
    if (reader.name() != QLatin1String(rootName)) {
        throw PayloadError(std::string("unexpected root <") + reader.name().toString().toStdString()
                           + ">, expected <" + rootName + ">");
    }
}

void checkReader(const QXmlStreamReader& reader)
{
    if (reader.hasError())
        throw PayloadError("malformed payload: " + reader.errorString().toStdString());
}

QString attribute(const QXmlStreamReader& reader, const char* name)
{
    return reader.attributes().value(QLatin1String(name)).toString();
}

RoomEntry readRoom(QXmlStreamReader& reader)
{
    RoomEntry room;
    room.name = attribute(reader, "name");
    room.udn = attribute(reader, "udn");
    if (reader.attributes().hasAttribute(QLatin1String("powerState")))
        room.powerState = powerStateFromString(attribute(reader, "powerState"));

    while (reader.readNextStartElement()) {
        // A room lists one renderer per device; the first one plays for the room.
        if (reader.name() == QLatin1String("renderer") && !room.rendererUdn)
            room.rendererUdn = attribute(reader, "udn");
        reader.skipCurrentElement();
    }
    return room;
}

QList<RoomEntry> readRooms(QXmlStreamReader& reader)
{
    QList<RoomEntry> rooms;
    while (reader.readNextStartElement()) {
        if (reader.name() == QLatin1String("room"))
            rooms.append(readRoom(reader));
        else
            reader.skipCurrentElement();
    }
    return rooms;
}

} // namespace

HostInfoPayload decodeHostInfo(const QByteArray& xml)
{
    QXmlStreamReader reader(xml);
    enterRoot(reader, "hostInfo");

    HostInfoPayload payload;
    while (reader.readNextStartElement()) {
        const QString key = reader.name().toString();
        payload.fields.insert(key, reader.readElementText(QXmlStreamReader::SkipChildElements).trimmed());
    }
    checkReader(reader);
    return payload;
}

ZoneConfigPayload decodeZoneConfig(const QByteArray& xml)
{
    QXmlStreamReader reader(xml);
    enterRoot(reader, "zoneConfig");

    ZoneConfigPayload payload;
    while (reader.readNextStartElement()) {
        if (reader.name() == QLatin1String("zones")) {
            while (reader.readNextStartElement()) {
                if (reader.name() != QLatin1String("zone")) {
                    reader.skipCurrentElement();
                    continue;
                }
                ZoneEntry zone;
                zone.udn = attribute(reader, "udn");
                zone.rooms = readRooms(reader);
                payload.zones.append(zone);
            }
        } else if (reader.name() == QLatin1String("unassignedRooms")) {
            payload.unassignedRooms.append(readRooms(reader));
        } else {
            reader.skipCurrentElement();
        }
    }
    checkReader(reader);
    return payload;
}

DeviceListPayload decodeDeviceList(const QByteArray& xml)
{
    QXmlStreamReader reader(xml);
    enterRoot(reader, "devices");

    DeviceListPayload payload;
    while (reader.readNextStartElement()) {
        if (reader.name() != QLatin1String("device")) {
            reader.skipCurrentElement();
            continue;
        }
        DeviceEntry device;
        device.udn = attribute(reader, "udn");
        device.type = attribute(reader, "type");
        device.location = attribute(reader, "location");
        device.name = reader.readElementText(QXmlStreamReader::SkipChildElements).trimmed();
        payload.devices.append(device);
    }
    checkReader(reader);
    return payload;
}

SystemStatePayload decodeSystemState(const QByteArray& xml)
{
    QXmlStreamReader reader(xml);
    enterRoot(reader, "systemState");

    SystemStatePayload payload;
    while (reader.readNextStartElement()) {
        QMap<QString, QString> attrs;
        for (const auto& attr : reader.attributes())
            attrs.insert(attr.name().toString(), attr.value().toString());
        payload.entries.insert(reader.name().toString(), attrs);
        reader.skipCurrentElement();
    }
    checkReader(reader);
    return payload;
}

} // namespace rlk
