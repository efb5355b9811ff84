#pragma once

#include <QVector>

#include "meetings/core/Notification.hpp"

namespace meetings {
namespace server {

class ClientSession;
class SessionRegistry;

class NotificationDispatcher
{
public:
    explicit NotificationDispatcher(const SessionRegistry &registry);

    // Sends every notification to its employee's push channel when that
    // employee has an active session. Returns the number of pushed messages.
    int dispatch(const QVector<core::Notification> &notifications) const;
    int replay(ClientSession &session, const QVector<core::Notification> &notifications) const;

private:
    static int deliver(ClientSession &session, const core::Notification &notification);

    const SessionRegistry &m_registry;
};

} // namespace server
} // namespace meetings
