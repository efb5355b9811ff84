#include "meetings/net/Protocol.hpp"

#include <array>
#include <utility>

namespace meetings {
namespace net {

namespace {
constexpr std::array<std::pair<MessageTag, const char *>, 13> TAG_NAMES{{
    {MessageTag::AuthRequest, "POST_CLIENTSIDE_AUTH_REQUEST"},
    {MessageTag::CreateMeetingRequest, "PUSH_CLIENTSIDE_MEETING_CREATION_REQUEST"},
    {MessageTag::UpdateMeetingRequest, "PUSH_CLIENTSIDE_MEETING_UPDATE_REQUEST"},
    {MessageTag::DeleteMeetingRequest, "PUSH_CLIENTSIDE_MEETING_DELETION_REQUEST"},
    {MessageTag::MeetingsByIdRequest, "GET_SERVERSIDE_MEETING_INFORMATION_BY_ID_REQUEST"},
    {MessageTag::AuthResponse, "POST_SERVERSIDE_AUTH_RESPONSE"},
    {MessageTag::CreateMeetingResponse, "PUSH_SERVERSIDE_MEETING_CREATION_RESPONSE"},
    {MessageTag::UpdateMeetingResponse, "PUSH_SERVERSIDE_MEETING_UPDATE_RESPONSE"},
    {MessageTag::DeleteMeetingResponse, "PUSH_SERVERSIDE_MEETING_DELETION_RESPONSE"},
    {MessageTag::MeetingsByIdResponse, "GET_SERVERSIDE_MEETING_INFORMATION_BY_ID_RESPONSE"},
    {MessageTag::ConflictUpdate, "PUSH_SERVERSIDE_MEETING_CONFLICT_UPDATE_REQUEST"},
    {MessageTag::ConflictResolution, "PUSH_SERVERSIDE_MEETING_CONFLICT_RESOLUTION_NOTIFICATION"},
    {MessageTag::DeletionNotification, "PUSH_SERVERSIDE_MEETING_DELETION_NOTIFICATION"},
}};
} // namespace

QByteArray tagName(MessageTag tag)
{
    for (const auto &entry : TAG_NAMES) {
        if (entry.first == tag) {
            return QByteArray(entry.second);
        }
    }
    return {};
}

std::optional<MessageTag> tagFromName(const QByteArray &name)
{
    for (const auto &entry : TAG_NAMES) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

bool isPushTag(MessageTag tag)
{
    return tag == MessageTag::ConflictUpdate
        || tag == MessageTag::ConflictResolution
        || tag == MessageTag::DeletionNotification;
}

QByteArray encodeAcknowledgment(bool accepted)
{
    return accepted ? QByteArrayLiteral("true") : QByteArrayLiteral("false");
}

bool parseAcknowledgment(const QByteArray &body)
{
    return body.trimmed().toLower() == "true";
}

} // namespace net
} // namespace meetings
