#include "meetings/server/MeetingServer.hpp"

#include <QTcpSocket>

#include "meetings/core/Logging.hpp"
#include "meetings/server/ClientSession.hpp"

namespace meetings {
namespace server {

MeetingServer::MeetingServer(ServerSettings settings, core::MeetingService &service, QObject *parent)
    : QObject(parent)
    , m_settings(std::move(settings))
    , m_service(service)
    , m_dispatcher(m_registry)
{
    connect(&m_listener, &QTcpServer::newConnection, this, &MeetingServer::onNewConnection);
}

MeetingServer::~MeetingServer()
{
    stop();
}

bool MeetingServer::start()
{
    if (m_listener.isListening()) {
        return true;
    }
    m_listener.setMaxPendingConnections(m_settings.backlog);
    if (!m_listener.listen(m_settings.address, m_settings.port)) {
        qCCritical(lcServer) << "Cannot listen on" << m_settings.address.toString() << m_settings.port
                             << m_listener.errorString();
        return false;
    }
    qCInfo(lcServer) << "Listening on" << m_settings.address.toString() << m_listener.serverPort()
                     << "with" << m_settings.accounts.size() << "accounts";
    return true;
}

void MeetingServer::stop()
{
    if (m_listener.isListening()) {
        m_listener.close();
        qCInfo(lcServer) << "Stopped listening";
    }
    const QVector<QPointer<ClientSession>> sessions = m_sessions;
    for (const QPointer<ClientSession> &session : sessions) {
        if (session) {
            session->close();
        }
    }
    m_sessions.clear();
}

bool MeetingServer::isListening() const
{
    return m_listener.isListening();
}

quint16 MeetingServer::serverPort() const
{
    return m_listener.serverPort();
}

QString MeetingServer::errorString() const
{
    return m_listener.errorString();
}

const ServerSettings &MeetingServer::settings() const
{
    return m_settings;
}

const SessionRegistry &MeetingServer::registry() const
{
    return m_registry;
}

int MeetingServer::sessionCount() const
{
    return m_sessions.size();
}

void MeetingServer::onNewConnection()
{
    while (QTcpSocket *socket = m_listener.nextPendingConnection()) {
        SessionContext context;
        context.settings = &m_settings;
        context.service = &m_service;
        context.registry = &m_registry;
        context.dispatcher = &m_dispatcher;

        auto *session = new ClientSession(socket, context, this);
        connect(session, &ClientSession::activated, this, &MeetingServer::sessionActivated);
        connect(session, &ClientSession::closed, this, &MeetingServer::onSessionClosed);
        m_sessions.append(QPointer<ClientSession>(session));
    }
}

void MeetingServer::onSessionClosed(ClientSession *session)
{
    for (int i = m_sessions.size() - 1; i >= 0; --i) {
        if (m_sessions.at(i).isNull() || m_sessions.at(i).data() == session) {
            m_sessions.removeAt(i);
        }
    }
    emit sessionClosed();
}

} // namespace server
} // namespace meetings
