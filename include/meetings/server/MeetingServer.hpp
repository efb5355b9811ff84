#pragma once

#include <QObject>
#include <QPointer>
#include <QTcpServer>
#include <QVector>

#include "meetings/server/NotificationDispatcher.hpp"
#include "meetings/server/ServerSettings.hpp"
#include "meetings/server/SessionRegistry.hpp"

namespace meetings {
namespace core {
class MeetingService;
}

namespace server {

class ClientSession;

class MeetingServer : public QObject
{
    Q_OBJECT

public:
    MeetingServer(ServerSettings settings, core::MeetingService &service, QObject *parent = nullptr);
    ~MeetingServer() override;

    bool start();
    void stop();

    bool isListening() const;
    quint16 serverPort() const;
    QString errorString() const;
    const ServerSettings &settings() const;
    const SessionRegistry &registry() const;
    int sessionCount() const;

signals:
    void sessionActivated(const QString &employeeId);
    void sessionClosed();

private slots:
    void onNewConnection();
    void onSessionClosed(meetings::server::ClientSession *session);

private:
    ServerSettings m_settings;
    core::MeetingService &m_service;
    QTcpServer m_listener;
    SessionRegistry m_registry;
    NotificationDispatcher m_dispatcher;
    QVector<QPointer<ClientSession>> m_sessions;
};

} // namespace server
} // namespace meetings
