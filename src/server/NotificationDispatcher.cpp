#include "meetings/server/NotificationDispatcher.hpp"

#include "meetings/core/Logging.hpp"
#include "meetings/data/MeetingJson.hpp"
#include "meetings/net/Protocol.hpp"
#include "meetings/server/ClientSession.hpp"
#include "meetings/server/SessionRegistry.hpp"

namespace meetings {
namespace server {

namespace {
net::MessageTag tagFor(core::NotificationKind kind)
{
    switch (kind) {
    case core::NotificationKind::ConflictResolution:
        return net::MessageTag::ConflictResolution;
    case core::NotificationKind::Deletion:
        return net::MessageTag::DeletionNotification;
    case core::NotificationKind::ConflictUpdate:
    default:
        return net::MessageTag::ConflictUpdate;
    }
}
} // namespace

NotificationDispatcher::NotificationDispatcher(const SessionRegistry &registry)
    : m_registry(registry)
{
}

int NotificationDispatcher::dispatch(const QVector<core::Notification> &notifications) const
{
    int sent = 0;
    for (const core::Notification &notification : notifications) {
        ClientSession *session = m_registry.find(notification.employeeId);
        if (!session || !session->hasPushChannel()) {
            qCDebug(lcSession) << "Skipping notification for offline employee" << notification.employeeId;
            continue;
        }
        sent += deliver(*session, notification);
    }
    return sent;
}

int NotificationDispatcher::replay(ClientSession &session, const QVector<core::Notification> &notifications) const
{
    int sent = 0;
    for (const core::Notification &notification : notifications) {
        sent += deliver(session, notification);
    }
    qCInfo(lcSession) << "Replayed" << notifications.size() << "conflict groups to" << session.employeeId();
    return sent;
}

int NotificationDispatcher::deliver(ClientSession &session, const core::Notification &notification)
{
    const net::MessageTag tag = tagFor(notification.kind);
    int sent = 0;
    for (const data::Meeting &meeting : notification.meetings) {
        if (!session.push(tag, data::encodeMeeting(meeting))) {
            break;
        }
        ++sent;
    }
    return sent;
}

} // namespace server
} // namespace meetings
