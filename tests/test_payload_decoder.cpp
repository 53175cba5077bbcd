#include <QtTest>
#include "core/topology/Errors.hpp"
#include "core/topology/PayloadDecoder.hpp"
#include "TestSupport.hpp"

using namespace rlk;

class TestPayloadDecoder : public QObject {
    Q_OBJECT

private slots:
    void testZoneConfigFixture();
    void testZoneConfigOptionalAttributes();
    void testDeviceListFixture();
    void testHostInfoFixture();
    void testSystemStateFixture();
    void testWrongRootThrows();
    void testMalformedXmlThrows();
    void testEmptyPayloadThrows();
    void testEmptyZoneConfig();
};

void TestPayloadDecoder::testZoneConfigFixture()
{
    const auto payload = decodeZoneConfig(testing::readFixture("zones.xml"));

    QCOMPARE(payload.zones.size(), 1);
    const auto& zone = payload.zones.first();
    QCOMPARE(zone.udn, QString("uuid:zone-1"));
    QCOMPARE(zone.rooms.size(), 2);

    const auto& kitchen = zone.rooms.at(0);
    QCOMPARE(kitchen.name, QString("Kitchen"));
    QCOMPARE(kitchen.udn, QString("uuid:room-kitchen"));
    QVERIFY(kitchen.powerState.has_value());
    QCOMPARE(*kitchen.powerState, PowerState::On);
    // First renderer of the room wins
    QCOMPARE(kitchen.rendererUdn.value_or(QString()), QString("uuid:renderer-kitchen-1"));

    QCOMPARE(*zone.rooms.at(1).powerState, PowerState::Standby);

    QCOMPARE(payload.unassignedRooms.size(), 1);
    QCOMPARE(payload.unassignedRooms.first().name, QString("Bath"));
    QVERIFY(!payload.unassignedRooms.first().rendererUdn.has_value());
}

void TestPayloadDecoder::testZoneConfigOptionalAttributes()
{
    const QByteArray xml =
        "<zoneConfig><zones><zone udn=\"uuid:z\">"
        "<room name=\"Attic\" udn=\"uuid:attic\"/>"
        "<room name=\"Cellar\" udn=\"uuid:cellar\" powerState=\"SOMETHING_NEW\"/>"
        "</zone></zones></zoneConfig>";
    const auto payload = decodeZoneConfig(xml);

    QCOMPARE(payload.zones.size(), 1);
    QVERIFY(!payload.zones.first().rooms.at(0).powerState.has_value());
    QCOMPARE(*payload.zones.first().rooms.at(1).powerState, PowerState::Unknown);
    QVERIFY(payload.unassignedRooms.isEmpty());
}

void TestPayloadDecoder::testDeviceListFixture()
{
    const auto payload = decodeDeviceList(testing::readFixture("devices.xml"));

    QCOMPARE(payload.devices.size(), 4);
    QCOMPARE(payload.devices.at(0).udn, QString("uuid:zone-1"));
    QCOMPARE(payload.devices.at(0).location, QString("http://192.168.1.20:52100/zone-1.xml"));
    QCOMPARE(payload.devices.at(0).name, QString("Kitchen, Living"));
    QCOMPARE(payload.devices.at(2).type, QString("urn:schemas-upnp-org:device:MediaServer:1"));
}

void TestPayloadDecoder::testHostInfoFixture()
{
    const auto payload = decodeHostInfo(testing::readFixture("hostinfo.xml"));

    QCOMPARE(payload.fields.value("hostName"), QString("raumfeld-base"));
    QCOMPARE(payload.fields.value("roomName"), QString("Kitchen"));
    QCOMPARE(payload.fields.value("softwareVersion"), QString("1.2.3"));
}

void TestPayloadDecoder::testSystemStateFixture()
{
    const auto payload = decodeSystemState(testing::readFixture("systemstate.xml"));

    QCOMPARE(payload.entries.size(), 3);
    QCOMPARE(payload.entries.value("updateAvailable").value("value"), QString("yes"));
    QCOMPARE(payload.entries.value("timezone").value("dst"), QString("1"));
}

void TestPayloadDecoder::testWrongRootThrows()
{
    QVERIFY_THROWS_EXCEPTION(PayloadError, decodeZoneConfig("<devices/>"));
    QVERIFY_THROWS_EXCEPTION(PayloadError, decodeHostInfo("<zoneConfig/>"));
}

void TestPayloadDecoder::testMalformedXmlThrows()
{
    QVERIFY_THROWS_EXCEPTION(PayloadError,
        decodeDeviceList("<devices><device udn=\"a\">x</devic></devices>"));
    QVERIFY_THROWS_EXCEPTION(PayloadError, decodeSystemState("<systemState><a value=\"1\">"));
}

void TestPayloadDecoder::testEmptyPayloadThrows()
{
    QVERIFY_THROWS_EXCEPTION(PayloadError, decodeZoneConfig(QByteArray()));
}

void TestPayloadDecoder::testEmptyZoneConfig()
{
    const auto payload = decodeZoneConfig("<zoneConfig/>");
    QVERIFY(payload.zones.isEmpty());
    QVERIFY(payload.unassignedRooms.isEmpty());
}

QTEST_MAIN(TestPayloadDecoder)
#include "test_payload_decoder.moc"
