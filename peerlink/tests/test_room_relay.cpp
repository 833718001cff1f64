#include <QtTest/QtTest>

#include "signaling/room_relay.hpp"
#include "signaling/signaling_protocol.hpp"
#include "helpers/recording_connection.hpp"

using namespace peerlink;
using peerlink::test::makeConnection;
namespace Proto = peerlink::SignalingProtocol;

class RoomRelayTests : public QObject {
    Q_OBJECT

private slots:
    void firstOccupantIsInitiator();
    void secondOccupantTriggersPeerJoined();
    void thirdConnectionRejected();
    void relaysVerbatimToOtherOccupant();
    void dropsUnparseableFrames();
    void slotFreedOnDisconnect();
};

void RoomRelayTests::firstOccupantIsInitiator() {
    RoomRelay room;
    auto a = makeConnection("a");
    room.onConnect(a);

    QCOMPARE(a->sent().size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(a->sent().front()),
             QString::fromStdString(Proto::createInit(true)));
    QCOMPARE(room.occupantCount(), static_cast<size_t>(1));
}

void RoomRelayTests::secondOccupantTriggersPeerJoined() {
    RoomRelay room;
    auto a = makeConnection("a");
    auto b = makeConnection("b");
    room.onConnect(a);
    a->clear();
    room.onConnect(b);

    QCOMPARE(b->sent().size(), static_cast<size_t>(1));
    const auto init = Proto::parseEnvelope(b->sent().front());
    QCOMPARE(QString::fromStdString(init.field("isInitiator")), QString("false"));

    QCOMPARE(a->sent().size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(Proto::parseEnvelope(a->sent().front()).type), QString("peer-joined"));
}

void RoomRelayTests::thirdConnectionRejected() {
    RoomRelay room;
    auto a = makeConnection("a");
    auto b = makeConnection("b");
    auto c = makeConnection("c");
    room.onConnect(a);
    room.onConnect(b);
    room.onConnect(c);

    QCOMPARE(room.occupantCount(), static_cast<size_t>(2));
    QCOMPARE(c->sent().size(), static_cast<size_t>(1));
    const auto error = Proto::parseEnvelope(c->sent().front());
    QCOMPARE(QString::fromStdString(error.type), QString("error"));
    QCOMPARE(QString::fromStdString(error.field("message")), QString("Room is full"));
    QVERIFY(c->closed());

    // A rejected connection cannot inject frames
    a->clear();
    room.onMessage(c, Proto::createPublicKey("", "", "a2V5"));
    QVERIFY(a->sent().empty());
}

void RoomRelayTests::relaysVerbatimToOtherOccupant() {
    RoomRelay room;
    auto a = makeConnection("a");
    auto b = makeConnection("b");
    room.onConnect(a);
    room.onConnect(b);
    a->clear();
    b->clear();

    const std::string frame = "{\"type\":\"offer\",\"offer\":\"v=0\",\"extra\":{\"k\":[1,2]}}";
    room.onMessage(a, frame);
    QCOMPARE(b->sent().size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(b->sent().front()), QString::fromStdString(frame));
    QVERIFY(a->sent().empty());

    // Nothing to relay to when alone
    room.onDisconnect(b);
    room.onMessage(a, frame);
    QVERIFY(a->sent().empty());
}

void RoomRelayTests::dropsUnparseableFrames() {
    RoomRelay room;
    auto a = makeConnection("a");
    auto b = makeConnection("b");
    room.onConnect(a);
    room.onConnect(b);
    b->clear();

    room.onMessage(a, "garbage");
    room.onMessage(a, "{\"type\":");
    QVERIFY(b->sent().empty());
    QVERIFY(!a->closed());
}

void RoomRelayTests::slotFreedOnDisconnect() {
    RoomRelay room;
    auto a = makeConnection("a");
    auto b = makeConnection("b");
    auto c = makeConnection("c");
    room.onConnect(a);
    room.onConnect(b);
    room.onDisconnect(a);
    QCOMPARE(room.occupantCount(), static_cast<size_t>(1));

    b->clear();
    room.onConnect(c);
    QVERIFY(!c->closed());
    QCOMPARE(QString::fromStdString(Proto::parseEnvelope(c->sent().front()).field("isInitiator")),
             QString("false"));
    QCOMPARE(QString::fromStdString(Proto::parseEnvelope(b->sent().front()).type), QString("peer-joined"));
}

QTEST_MAIN(RoomRelayTests)
#include "test_room_relay.moc"
