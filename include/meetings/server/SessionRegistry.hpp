#pragma once

#include <QHash>
#include <QPointer>
#include <QString>
#include <QStringList>

namespace meetings {
namespace server {

class ClientSession;

// employee id -> authenticated session. Lives on the server thread.
class SessionRegistry
{
public:
    // Returns the session previously bound to the id, if any.
    ClientSession *bind(const QString &employeeId, ClientSession *session);
    // Removes the binding only while it still points at `session`.
    void release(const QString &employeeId, const ClientSession *session);

    ClientSession *find(const QString &employeeId) const;
    QStringList employeeIds() const;
    int size() const;

private:
    QHash<QString, QPointer<ClientSession>> m_sessions;
};

} // namespace server
} // namespace meetings
