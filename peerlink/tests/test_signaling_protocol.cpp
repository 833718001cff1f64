#include <QtTest/QtTest>

#include "core/errors.hpp"
#include "signaling/signaling_protocol.hpp"
#include "utils/json_parser.hpp"

namespace Proto = peerlink::SignalingProtocol;

class SignalingProtocolTests : public QObject {
    Q_OBJECT

private slots:
    void registerCarriesIdentityAsSender();
    void offerRoundTripsSdp();
    void iceCandidateCarriesMid();
    void roomMessagesOmitAddressing();
    void chatPayloadFields();
    void parseRejectsUnknownType();
    void parseRejectsMissingFields();
    void parseRejectsNonBooleanInit();
    void parseWrapsMalformedJson();
};

void SignalingProtocolTests::registerCarriesIdentityAsSender() {
    const auto envelope = Proto::parseEnvelope(Proto::createRegister("pk-A"));
    QCOMPARE(QString::fromStdString(envelope.type), QString("register"));
    QCOMPARE(QString::fromStdString(envelope.sender), QString("pk-A"));
    QVERIFY(!envelope.hasRecipient());
    QVERIFY(envelope.fields.empty());
}

void SignalingProtocolTests::offerRoundTripsSdp() {
    const std::string sdp = "v=0\r\no=- 1 2 IN IP4 127.0.0.1\r\na=\"quoted\"\r\n";
    const auto envelope = Proto::parseEnvelope(Proto::createOffer("A", "B", sdp));
    QCOMPARE(QString::fromStdString(envelope.type), QString("offer"));
    QCOMPARE(QString::fromStdString(envelope.sender), QString("A"));
    QCOMPARE(QString::fromStdString(envelope.recipient), QString("B"));
    QCOMPARE(envelope.field("offer"), sdp);

    const auto answer = Proto::parseEnvelope(Proto::createAnswer("B", "A", "v=0 answer"));
    QCOMPARE(QString::fromStdString(answer.field("answer")), QString("v=0 answer"));
}

void SignalingProtocolTests::iceCandidateCarriesMid() {
    const auto envelope = Proto::parseEnvelope(
        Proto::createIceCandidate("A", "B", "candidate:1 1 udp 1 10.0.0.1 5000 typ host", "0"));
    QCOMPARE(QString::fromStdString(envelope.type), QString("ice-candidate"));
    QCOMPARE(QString::fromStdString(envelope.field("candidate")),
             QString("candidate:1 1 udp 1 10.0.0.1 5000 typ host"));
    QCOMPARE(QString::fromStdString(envelope.field("sdpMid")), QString("0"));
}

void SignalingProtocolTests::roomMessagesOmitAddressing() {
    QCOMPARE(QString::fromStdString(Proto::createInit(true)),
             QString("{\"type\":\"init\",\"isInitiator\":true}"));
    QCOMPARE(QString::fromStdString(Proto::createError("Room is full")),
             QString("{\"type\":\"error\",\"message\":\"Room is full\"}"));
    QCOMPARE(QString::fromStdString(Proto::createPeerJoined()), QString("{\"type\":\"peer-joined\"}"));

    const auto key = Proto::parseEnvelope(Proto::createPublicKey("", "", "a2V5"));
    QVERIFY(!key.hasSender());
    QVERIFY(!key.hasRecipient());
    QCOMPARE(QString::fromStdString(key.field("key")), QString("a2V5"));

    const auto init = Proto::parseEnvelope(Proto::createInit(false));
    QCOMPARE(QString::fromStdString(init.field("isInitiator")), QString("false"));
}

void SignalingProtocolTests::chatPayloadFields() {
    const auto payload = peerlink::JsonParser::parse(Proto::createChatPayload("hi \"there\"", "A", "B"));
    QCOMPARE(QString::fromStdString(payload.at("text")), QString("hi \"there\""));
    QCOMPARE(QString::fromStdString(payload.at("sender")), QString("A"));
    QCOMPARE(QString::fromStdString(payload.at("recipient")), QString("B"));

    const auto frame = Proto::parseEnvelope(Proto::createEncryptedMessage("AAAA"));
    QCOMPARE(QString::fromStdString(frame.type), QString("encrypted-message"));
    QCOMPARE(QString::fromStdString(frame.field("message")), QString("AAAA"));
}

void SignalingProtocolTests::parseRejectsUnknownType() {
    QVERIFY_EXCEPTION_THROWN(Proto::parseEnvelope("{\"type\":\"bogus\",\"sender\":\"A\"}"),
                             peerlink::SignalingParseError);
    QVERIFY_EXCEPTION_THROWN(Proto::parseEnvelope("{\"sender\":\"A\"}"),
                             peerlink::SignalingParseError);
}

void SignalingProtocolTests::parseRejectsMissingFields() {
    QVERIFY_EXCEPTION_THROWN(Proto::parseEnvelope("{\"type\":\"register\"}"),
                             peerlink::SignalingParseError);
    QVERIFY_EXCEPTION_THROWN(Proto::parseEnvelope("{\"type\":\"offer\",\"sender\":\"A\"}"),
                             peerlink::SignalingParseError);
    QVERIFY_EXCEPTION_THROWN(Proto::parseEnvelope("{\"type\":\"ecdh-public-key\",\"sender\":\"A\"}"),
                             peerlink::SignalingParseError);
    QVERIFY_EXCEPTION_THROWN(Proto::parseEnvelope("{\"type\":\"encrypted-message\"}"),
                             peerlink::SignalingParseError);

    try {
        Proto::parseEnvelope("{\"type\":\"answer\",\"sender\":\"B\",\"recipient\":\"A\"}");
        QFAIL("answer without sdp accepted");
    } catch (const peerlink::SignalingParseError& e) {
        QCOMPARE(e.kind(), peerlink::ErrorKind::SignalingParse);
        QVERIFY(std::string(e.what()).find("answer") != std::string::npos);
    }
}

void SignalingProtocolTests::parseRejectsNonBooleanInit() {
    QVERIFY_EXCEPTION_THROWN(Proto::parseEnvelope("{\"type\":\"init\",\"isInitiator\":\"yes\"}"),
                             peerlink::SignalingParseError);
    QVERIFY_EXCEPTION_THROWN(Proto::parseEnvelope("{\"type\":\"init\"}"),
                             peerlink::SignalingParseError);
}

void SignalingProtocolTests::parseWrapsMalformedJson() {
    QVERIFY_EXCEPTION_THROWN(Proto::parseEnvelope("{\"type\":"), peerlink::SignalingParseError);
    QVERIFY_EXCEPTION_THROWN(Proto::parseEnvelope("hello"), peerlink::SignalingParseError);
}

QTEST_MAIN(SignalingProtocolTests)
#include "test_signaling_protocol.moc"
