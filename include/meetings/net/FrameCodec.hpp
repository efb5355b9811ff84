#pragma once

#include <QByteArray>
#include <QtGlobal>
#include <optional>

#include "meetings/net/Protocol.hpp"

class QIODevice;

namespace meetings {
namespace net {

constexpr qint32 MaxPayloadBytes = 16 * 1024 * 1024;

struct Message
{
    MessageTag tag = MessageTag::AuthRequest;
    QByteArray body;
};

// The payload envelope is zlib data prefixed with the big-endian uncompressed
// length (qCompress layout).
QByteArray compactPayload(const QByteArray &text);
std::optional<QByteArray> expandPayload(const QByteArray &envelope);

// Frame layout: quint16 tag length, tag bytes (UTF-8), qint32 payload length,
// payload envelope. All integers big-endian.
QByteArray encodeFrame(MessageTag tag, const QByteArray &body);
bool writeFrame(QIODevice &device, MessageTag tag, const QByteArray &body);

class FrameReader
{
public:
    enum class Status
    {
        Incomplete,
        Frame,
        Dropped,
        Corrupt,
    };

    explicit FrameReader(QIODevice *device);

    // Consumes at most one frame. Incomplete frames are left in the device.
    Status read(Message *message);

private:
    QIODevice *m_device = nullptr;
};

} // namespace net
} // namespace meetings
