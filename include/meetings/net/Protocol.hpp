#pragma once

#include <QByteArray>
#include <optional>

namespace meetings {
namespace net {

enum class MessageTag
{
    // client -> server
    AuthRequest,
    CreateMeetingRequest,
    UpdateMeetingRequest,
    DeleteMeetingRequest,
    MeetingsByIdRequest,
    // server -> client, request channel
    AuthResponse,
    CreateMeetingResponse,
    UpdateMeetingResponse,
    DeleteMeetingResponse,
    MeetingsByIdResponse,
    // server -> client, push channel
    ConflictUpdate,
    ConflictResolution,
    DeletionNotification,
};

QByteArray tagName(MessageTag tag);
std::optional<MessageTag> tagFromName(const QByteArray &name);
bool isPushTag(MessageTag tag);

QByteArray encodeAcknowledgment(bool accepted);
bool parseAcknowledgment(const QByteArray &body);

} // namespace net
} // namespace meetings
