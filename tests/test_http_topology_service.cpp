#include <QtTest>
#include <QSignalSpy>
#include <QUrlQuery>
#include "core/control/HttpTopologyService.hpp"
#include "StubHttpServer.hpp"

using namespace rlk;
using testing::StubHttpServer;

class TestHttpTopologyService : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testConnectRoomsToNewZone();
    void testConnectRoomToZone();
    void testDropRoom();
    void testStandbyRequests();
    void testFailedRequestIsReported();
    void testUnansweredRequestTimesOut();

private:
    // Path and query of the n-th recorded request
    QUrl requestUrl(int n) const
    {
        const QByteArray line = StubHttpServer::requestLine(server_->requests.at(n));
        return QUrl(QString::fromUtf8(line.split(' ').at(1)));
    }

    StubHttpServer* server_ = nullptr;
    HttpTopologyService* service_ = nullptr;
};

void TestHttpTopologyService::init()
{
    server_ = new StubHttpServer;
    QVERIFY(server_->listen());
    QUrl base;
    base.setScheme("http");
    base.setHost("127.0.0.1");
    base.setPort(server_->port());
    service_ = new HttpTopologyService(base, 5000);
}

void TestHttpTopologyService::cleanup()
{
    delete service_;
    delete server_;
}

void TestHttpTopologyService::testConnectRoomsToNewZone()
{
    QSignalSpy spy(service_, &HttpTopologyService::requestFinished);
    service_->connectRoomsToZone(QString(), {"uuid:room-a", "uuid:room-b"});

    QTRY_COMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("/connectRoomsToZone"));
    QCOMPARE(spy.at(0).at(1).toBool(), true);

    const QUrl url = requestUrl(0);
    const QUrlQuery query(url);
    QCOMPARE(url.path(), QString("/connectRoomsToZone"));
    QVERIFY(!query.hasQueryItem("zoneUDN"));
    QCOMPARE(query.queryItemValue("roomUDNs", QUrl::FullyDecoded), QString("uuid:room-a,uuid:room-b"));
}

void TestHttpTopologyService::testConnectRoomToZone()
{
    QSignalSpy spy(service_, &HttpTopologyService::requestFinished);
    service_->connectRoomToZone("uuid:zone-1", "uuid:room-c");
    QTRY_COMPARE(spy.count(), 1);

    const QUrlQuery query(requestUrl(0));
    QCOMPARE(requestUrl(0).path(), QString("/connectRoomToZone"));
    QCOMPARE(query.queryItemValue("zoneUDN", QUrl::FullyDecoded), QString("uuid:zone-1"));
    QCOMPARE(query.queryItemValue("roomUDN", QUrl::FullyDecoded), QString("uuid:room-c"));
}

void TestHttpTopologyService::testDropRoom()
{
    QSignalSpy spy(service_, &HttpTopologyService::requestFinished);
    service_->dropRoom("uuid:room-a");
    QTRY_COMPARE(spy.count(), 1);

    QCOMPARE(requestUrl(0).path(), QString("/dropRoomJob"));
    QCOMPARE(QUrlQuery(requestUrl(0)).queryItemValue("roomUDN", QUrl::FullyDecoded),
             QString("uuid:room-a"));
}

void TestHttpTopologyService::testStandbyRequests()
{
    QSignalSpy spy(service_, &HttpTopologyService::requestFinished);
    service_->enterAutomaticStandby("uuid:r");
    QTRY_COMPARE(spy.count(), 1);
    service_->enterManualStandby("uuid:r");
    QTRY_COMPARE(spy.count(), 2);
    service_->leaveStandby("uuid:r");
    QTRY_COMPARE(spy.count(), 3);

    QCOMPARE(requestUrl(0).path(), QString("/enterAutomaticStandby"));
    QCOMPARE(requestUrl(1).path(), QString("/enterManualStandby"));
    QCOMPARE(requestUrl(2).path(), QString("/leaveStandby"));
}

void TestHttpTopologyService::testFailedRequestIsReported()
{
    StubHttpServer::Response response;
    response.status = 500;
    server_->enqueue(response);

    QSignalSpy spy(service_, &HttpTopologyService::requestFinished);
    service_->dropRoom("uuid:room-a");
    QTRY_COMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toBool(), false);
}

void TestHttpTopologyService::testUnansweredRequestTimesOut()
{
    StubHttpServer::Response held;
    held.holdOpen = true;
    server_->enqueue(held);

    QUrl base;
    base.setScheme("http");
    base.setHost("127.0.0.1");
    base.setPort(server_->port());
    HttpTopologyService service(base, 200);

    QSignalSpy spy(&service, &HttpTopologyService::requestFinished);
    service.leaveStandby("uuid:r");
    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 3000);
    QCOMPARE(spy.at(0).at(0).toString(), QString("/leaveStandby"));
    QCOMPARE(spy.at(0).at(1).toBool(), false);
}

QTEST_MAIN(TestHttpTopologyService)
#include "test_http_topology_service.moc"
