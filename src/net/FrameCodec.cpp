#include "meetings/net/FrameCodec.hpp"

#include <QDataStream>
#include <QIODevice>
#include <QtEndian>

#include "meetings/core/Logging.hpp"

namespace meetings {
namespace net {

namespace {
constexpr int ENVELOPE_HEADER_BYTES = 4;
} // namespace

QByteArray compactPayload(const QByteArray &text)
{
    return qCompress(text);
}

std::optional<QByteArray> expandPayload(const QByteArray &envelope)
{
    if (envelope.size() < ENVELOPE_HEADER_BYTES) {
        return std::nullopt;
    }
    const quint32 expected = qFromBigEndian<quint32>(envelope.constData());
    if (expected > static_cast<quint32>(MaxPayloadBytes)) {
        return std::nullopt;
    }
    if (expected == 0) {
        return QByteArray();
    }
    QByteArray text = qUncompress(envelope);
    if (text.isEmpty()) {
        return std::nullopt;
    }
    return text;
}

QByteArray encodeFrame(MessageTag tag, const QByteArray &body)
{
    const QByteArray name = tagName(tag);
    const QByteArray payload = compactPayload(body);

    QByteArray frame;
    QDataStream stream(&frame, QIODevice::WriteOnly);
    stream << static_cast<quint16>(name.size());
    stream.writeRawData(name.constData(), name.size());
    stream << static_cast<qint32>(payload.size());
    stream.writeRawData(payload.constData(), payload.size());
    return frame;
}

bool writeFrame(QIODevice &device, MessageTag tag, const QByteArray &body)
{
    const QByteArray frame = encodeFrame(tag, body);
    if (device.write(frame) != frame.size()) {
        qCWarning(lcProtocol) << "Failed to write" << tagName(tag) << device.errorString();
        return false;
    }
    return true;
}

FrameReader::FrameReader(QIODevice *device)
    : m_device(device)
{
}

FrameReader::Status FrameReader::read(Message *message)
{
    if (!m_device || m_device->bytesAvailable() <= 0) {
        return Status::Incomplete;
    }

    QDataStream stream(m_device);
    stream.startTransaction();

    quint16 tagLength = 0;
    stream >> tagLength;
    QByteArray name(tagLength, Qt::Uninitialized);
    stream.readRawData(name.data(), tagLength);

    qint32 payloadLength = 0;
    stream >> payloadLength;
    if (stream.status() != QDataStream::Ok) {
        stream.rollbackTransaction();
        return Status::Incomplete;
    }
    if (payloadLength < 0 || payloadLength > MaxPayloadBytes) {
        stream.abortTransaction();
        qCWarning(lcProtocol) << "Rejecting frame with payload length" << payloadLength;
        return Status::Corrupt;
    }

    QByteArray payload(payloadLength, Qt::Uninitialized);
    stream.readRawData(payload.data(), payloadLength);

    if (!stream.commitTransaction()) {
        return Status::Incomplete;
    }

    const auto tag = tagFromName(name);
    if (!tag) {
        qCWarning(lcProtocol) << "Dropping frame with unknown tag" << name;
        return Status::Dropped;
    }
    auto body = expandPayload(payload);
    if (!body) {
        qCWarning(lcProtocol) << "Dropping" << name << "frame with unreadable payload";
        return Status::Dropped;
    }

    if (message) {
        message->tag = *tag;
        message->body = std::move(*body);
    }
    return Status::Frame;
}

} // namespace net
} // namespace meetings
