#include "meetings/server/SessionRegistry.hpp"

#include "meetings/server/ClientSession.hpp"

namespace meetings {
namespace server {

ClientSession *SessionRegistry::bind(const QString &employeeId, ClientSession *session)
{
    ClientSession *previous = find(employeeId);
    m_sessions.insert(employeeId, QPointer<ClientSession>(session));
    return previous;
}

void SessionRegistry::release(const QString &employeeId, const ClientSession *session)
{
    const auto it = m_sessions.find(employeeId);
    if (it == m_sessions.end()) {
        return;
    }
    if (it.value().isNull() || it.value().data() == session) {
        m_sessions.erase(it);
    }
}

ClientSession *SessionRegistry::find(const QString &employeeId) const
{
    return m_sessions.value(employeeId).data();
}

QStringList SessionRegistry::employeeIds() const
{
    QStringList ids;
    for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
        if (!it.value().isNull()) {
            ids << it.key();
        }
    }
    return ids;
}

int SessionRegistry::size() const
{
    return employeeIds().size();
}

} // namespace server
} // namespace meetings
