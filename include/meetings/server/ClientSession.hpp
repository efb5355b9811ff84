#pragma once

#include <QObject>
#include <QString>

#include "meetings/net/FrameCodec.hpp"

class QTcpServer;
class QTcpSocket;

namespace meetings {
namespace core {
class MeetingService;
}

namespace server {

class NotificationDispatcher;
class SessionRegistry;
struct ServerSettings;

struct SessionContext
{
    const ServerSettings *settings = nullptr;
    core::MeetingService *service = nullptr;
    SessionRegistry *registry = nullptr;
    const NotificationDispatcher *dispatcher = nullptr;
};

// One connected client: the request channel it opened plus the push channel
// the server offers after a successful login.
class ClientSession : public QObject
{
    Q_OBJECT

public:
    enum class State
    {
        Connected,
        Authenticating,
        ChannelPending,
        Active,
        Closed,
    };
    Q_ENUM(State)

    ClientSession(QTcpSocket *socket, const SessionContext &context, QObject *parent = nullptr);
    ~ClientSession() override;

    State state() const;
    const QString &employeeId() const;
    bool hasPushChannel() const;
    quint16 pushPort() const;

    bool push(net::MessageTag tag, const QByteArray &body);

public slots:
    void close();

signals:
    void activated(const QString &employeeId);
    void closed(meetings::server::ClientSession *session);

private slots:
    void onReadyRead();
    void onPushConnection();

private:
    void processFrames();
    void handleMessage(const net::Message &message);
    void handleAuth(const QByteArray &body);
    void handleCreate(const QByteArray &body);
    void handleUpdate(const QByteArray &body);
    void handleDelete(const QByteArray &body);
    void handleMeetingsById(const QByteArray &body);
    void rejectUnauthenticated(const net::Message &message);
    void respond(net::MessageTag tag, const QByteArray &body);
    void setState(State state);

    SessionContext m_context;
    QTcpSocket *m_socket = nullptr;
    QTcpSocket *m_pushSocket = nullptr;
    QTcpServer *m_pushListener = nullptr;
    net::FrameReader m_reader;
    State m_state = State::Connected;
    QString m_employeeId;
};

} // namespace server
} // namespace meetings
