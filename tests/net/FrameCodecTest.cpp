#include <QtTest/QtTest>

#include <QBuffer>
#include <QDataStream>

#include "meetings/net/FrameCodec.hpp"
#include "meetings/net/Protocol.hpp"

using namespace meetings::net;

namespace {
QByteArray rawFrame(const QByteArray &tag, qint32 declaredLength, const QByteArray &payload)
{
    QByteArray frame;
    QDataStream stream(&frame, QIODevice::WriteOnly);
    stream << static_cast<quint16>(tag.size());
    stream.writeRawData(tag.constData(), tag.size());
    stream << declaredLength;
    stream.writeRawData(payload.constData(), payload.size());
    return frame;
}
} // namespace

class FrameCodecTest : public QObject
{
    Q_OBJECT

private slots:
    void readsConsecutiveFrames();
    void incompleteFrameIsKept();
    void unknownTagIsDropped();
    void unreadablePayloadIsDropped();
    void oversizedLengthIsCorrupt();
    void emptyBodySurvives();
    void acknowledgments();
    void tagNames();
};

void FrameCodecTest::readsConsecutiveFrames()
{
    QByteArray data = encodeFrame(MessageTag::CreateMeetingResponse, encodeAcknowledgment(true));
    data += encodeFrame(MessageTag::MeetingsByIdRequest, QByteArrayLiteral("E1"));
    QBuffer buffer(&data);
    QVERIFY(buffer.open(QIODevice::ReadOnly));

    FrameReader reader(&buffer);
    Message message;
    QVERIFY(reader.read(&message) == FrameReader::Status::Frame);
    QVERIFY(message.tag == MessageTag::CreateMeetingResponse);
    QCOMPARE(message.body, QByteArray("true"));

    QVERIFY(reader.read(&message) == FrameReader::Status::Frame);
    QVERIFY(message.tag == MessageTag::MeetingsByIdRequest);
    QCOMPARE(message.body, QByteArray("E1"));

    QVERIFY(reader.read(&message) == FrameReader::Status::Incomplete);
}

void FrameCodecTest::incompleteFrameIsKept()
{
    const QByteArray frame = encodeFrame(MessageTag::AuthRequest, QByteArrayLiteral("{\"credentialEmployeeID\":\"E1\"}"));
    QByteArray partial = frame.left(frame.size() - 3);
    QBuffer buffer(&partial);
    QVERIFY(buffer.open(QIODevice::ReadOnly));

    FrameReader reader(&buffer);
    Message message;
    QVERIFY(reader.read(&message) == FrameReader::Status::Incomplete);
    QCOMPARE(buffer.pos(), qint64(0));

    QByteArray headerOnly = frame.left(1);
    QBuffer tiny(&headerOnly);
    QVERIFY(tiny.open(QIODevice::ReadOnly));
    FrameReader tinyReader(&tiny);
    QVERIFY(tinyReader.read(&message) == FrameReader::Status::Incomplete);
}

void FrameCodecTest::unknownTagIsDropped()
{
    const QByteArray payload = compactPayload(QByteArrayLiteral("ignored"));
    QByteArray data = rawFrame(QByteArrayLiteral("NOT_A_REAL_TAG"), payload.size(), payload);
    data += encodeFrame(MessageTag::DeleteMeetingResponse, encodeAcknowledgment(false));
    QBuffer buffer(&data);
    QVERIFY(buffer.open(QIODevice::ReadOnly));

    FrameReader reader(&buffer);
    Message message;
    QVERIFY(reader.read(&message) == FrameReader::Status::Dropped);
    QVERIFY(reader.read(&message) == FrameReader::Status::Frame);
    QVERIFY(message.tag == MessageTag::DeleteMeetingResponse);
    QVERIFY(!parseAcknowledgment(message.body));
}

void FrameCodecTest::unreadablePayloadIsDropped()
{
    const QByteArray garbage = QByteArrayLiteral("\x00\x00\x00\x10garbage!");
    QByteArray data = rawFrame(tagName(MessageTag::ConflictUpdate), garbage.size(), garbage);
    QBuffer buffer(&data);
    QVERIFY(buffer.open(QIODevice::ReadOnly));

    FrameReader reader(&buffer);
    Message message;
    QVERIFY(reader.read(&message) == FrameReader::Status::Dropped);
    QVERIFY(!expandPayload(QByteArrayLiteral("ab")).has_value());
}

void FrameCodecTest::oversizedLengthIsCorrupt()
{
    QByteArray data = rawFrame(tagName(MessageTag::CreateMeetingRequest), MaxPayloadBytes + 1, QByteArray());
    QBuffer buffer(&data);
    QVERIFY(buffer.open(QIODevice::ReadOnly));

    FrameReader reader(&buffer);
    Message message;
    QVERIFY(reader.read(&message) == FrameReader::Status::Corrupt);

    QByteArray negative = rawFrame(tagName(MessageTag::CreateMeetingRequest), -5, QByteArray());
    QBuffer negativeBuffer(&negative);
    QVERIFY(negativeBuffer.open(QIODevice::ReadOnly));
    FrameReader negativeReader(&negativeBuffer);
    QVERIFY(negativeReader.read(&message) == FrameReader::Status::Corrupt);
}

void FrameCodecTest::emptyBodySurvives()
{
    QByteArray data = encodeFrame(MessageTag::MeetingsByIdRequest, QByteArray());
    QBuffer buffer(&data);
    QVERIFY(buffer.open(QIODevice::ReadOnly));

    FrameReader reader(&buffer);
    Message message;
    message.body = QByteArrayLiteral("stale");
    QVERIFY(reader.read(&message) == FrameReader::Status::Frame);
    QVERIFY(message.body.isEmpty());
}

void FrameCodecTest::acknowledgments()
{
    QVERIFY(parseAcknowledgment(encodeAcknowledgment(true)));
    QVERIFY(!parseAcknowledgment(encodeAcknowledgment(false)));
    QVERIFY(parseAcknowledgment(QByteArrayLiteral(" TRUE\n")));
    QVERIFY(!parseAcknowledgment(QByteArrayLiteral("1")));
    QVERIFY(!parseAcknowledgment(QByteArray()));
}

void FrameCodecTest::tagNames()
{
    QCOMPARE(tagName(MessageTag::AuthRequest), QByteArray("POST_CLIENTSIDE_AUTH_REQUEST"));
    QVERIFY(tagFromName("PUSH_SERVERSIDE_MEETING_DELETION_NOTIFICATION") == MessageTag::DeletionNotification);
    QVERIFY(!tagFromName("post_clientside_auth_request").has_value());
    QVERIFY(isPushTag(MessageTag::ConflictResolution));
    QVERIFY(!isPushTag(MessageTag::AuthResponse));
}

QTEST_GUILESS_MAIN(FrameCodecTest)
#include "FrameCodecTest.moc"
