#include "meetings/server/ClientSession.hpp"

#include <QTcpServer>
#include <QTcpSocket>

#include "meetings/core/Logging.hpp"
#include "meetings/core/MeetingService.hpp"
#include "meetings/data/MeetingJson.hpp"
#include "meetings/server/NotificationDispatcher.hpp"
#include "meetings/server/ServerSettings.hpp"
#include "meetings/server/SessionRegistry.hpp"

namespace meetings {
namespace server {

ClientSession::ClientSession(QTcpSocket *socket, const SessionContext &context, QObject *parent)
    : QObject(parent)
    , m_context(context)
    , m_socket(socket)
    , m_reader(socket)
{
    m_socket->setParent(this);
    connect(m_socket, &QTcpSocket::readyRead, this, &ClientSession::onReadyRead);
    connect(m_socket, &QTcpSocket::disconnected, this, &ClientSession::close);
    qCInfo(lcSession) << "Client connected from" << m_socket->peerAddress().toString() << m_socket->peerPort();
}

ClientSession::~ClientSession() = default;

ClientSession::State ClientSession::state() const
{
    return m_state;
}

const QString &ClientSession::employeeId() const
{
    return m_employeeId;
}

bool ClientSession::hasPushChannel() const
{
    return m_state == State::Active && m_pushSocket;
}

quint16 ClientSession::pushPort() const
{
    return m_pushListener ? m_pushListener->serverPort() : 0;
}

bool ClientSession::push(net::MessageTag tag, const QByteArray &body)
{
    if (!hasPushChannel()) {
        return false;
    }
    if (!net::writeFrame(*m_pushSocket, tag, body)) {
        close();
        return false;
    }
    return true;
}

void ClientSession::close()
{
    if (m_state == State::Closed) {
        return;
    }
    setState(State::Closed);
    if (!m_employeeId.isEmpty()) {
        m_context.registry->release(m_employeeId, this);
    }
    if (m_pushListener) {
        m_pushListener->close();
    }
    if (m_pushSocket) {
        m_pushSocket->disconnectFromHost();
    }
    m_socket->disconnectFromHost();
    qCInfo(lcSession) << "Session closed" << (m_employeeId.isEmpty() ? QStringLiteral("(anonymous)") : m_employeeId);
    emit closed(this);
    deleteLater();
}

void ClientSession::onReadyRead()
{
    processFrames();
}

void ClientSession::onPushConnection()
{
    QTcpSocket *socket = m_pushListener->nextPendingConnection();
    if (!socket) {
        return;
    }
    m_pushListener->close();
    m_pushListener->deleteLater();
    m_pushListener = nullptr;

    if (m_state != State::ChannelPending) {
        socket->abort();
        socket->deleteLater();
        return;
    }

    socket->setParent(this);
    m_pushSocket = socket;
    connect(m_pushSocket, &QTcpSocket::disconnected, this, &ClientSession::close);
    // The push channel is one-way; anything the client sends there is discarded.
    connect(m_pushSocket, &QTcpSocket::readyRead, m_pushSocket, [socket]() { socket->readAll(); });

    setState(State::Active);
    qCInfo(lcSession) << "Push channel established for" << m_employeeId;
    m_context.dispatcher->replay(*this, m_context.service->pendingConflictsFor(m_employeeId));
    emit activated(m_employeeId);

    // Requests that arrived while the push channel was pending.
    processFrames();
}

void ClientSession::processFrames()
{
    while (m_state != State::Closed && m_state != State::ChannelPending) {
        net::Message message;
        switch (m_reader.read(&message)) {
        case net::FrameReader::Status::Incomplete:
            return;
        case net::FrameReader::Status::Dropped:
            continue;
        case net::FrameReader::Status::Corrupt:
            qCWarning(lcProtocol) << "Corrupt frame from" << m_socket->peerAddress().toString() << "- closing session";
            close();
            return;
        case net::FrameReader::Status::Frame:
            handleMessage(message);
            break;
        }
    }
}

void ClientSession::handleMessage(const net::Message &message)
{
    if (message.tag == net::MessageTag::AuthRequest) {
        if (m_state != State::Connected) {
            qCWarning(lcSession) << "Repeated login attempt on session of" << m_employeeId;
            respond(net::MessageTag::AuthResponse, net::encodeAcknowledgment(false));
            return;
        }
        handleAuth(message.body);
        return;
    }

    if (m_state != State::Active) {
        rejectUnauthenticated(message);
        return;
    }

    switch (message.tag) {
    case net::MessageTag::CreateMeetingRequest:
        handleCreate(message.body);
        break;
    case net::MessageTag::UpdateMeetingRequest:
        handleUpdate(message.body);
        break;
    case net::MessageTag::DeleteMeetingRequest:
        handleDelete(message.body);
        break;
    case net::MessageTag::MeetingsByIdRequest:
        handleMeetingsById(message.body);
        break;
    default:
        qCWarning(lcProtocol) << "Unexpected message" << net::tagName(message.tag) << "from" << m_employeeId;
        break;
    }
}

void ClientSession::handleAuth(const QByteArray &body)
{
    setState(State::Authenticating);

    const auto credentials = data::decodeCredentials(body);
    if (!credentials || !m_context.settings->verify(credentials->employee.id, credentials->secret)) {
        qCWarning(lcSession) << "Authentication failed for"
                             << (credentials ? credentials->employee.id : QStringLiteral("(unreadable credentials)"));
        setState(State::Connected);
        respond(net::MessageTag::AuthResponse, net::encodeAcknowledgment(false));
        return;
    }

    const QString employeeId = credentials->employee.id;
    ClientSession *previous = m_context.registry->bind(employeeId, this);
    if (previous && previous != this) {
        qCInfo(lcSession) << "Evicting previous session of" << employeeId;
        previous->close();
    }
    m_employeeId = employeeId;

    m_pushListener = new QTcpServer(this);
    m_pushListener->setMaxPendingConnections(1);
    connect(m_pushListener, &QTcpServer::newConnection, this, &ClientSession::onPushConnection);
    const quint16 port = m_context.settings->pushPortFor(employeeId).value_or(0);
    if (!m_pushListener->listen(m_context.settings->address, port)) {
        qCWarning(lcSession) << "Cannot open push channel for" << employeeId << "on port" << port
                             << m_pushListener->errorString();
        delete m_pushListener;
        m_pushListener = nullptr;
        m_context.registry->release(employeeId, this);
        m_employeeId.clear();
        setState(State::Connected);
        respond(net::MessageTag::AuthResponse, net::encodeAcknowledgment(false));
        return;
    }

    setState(State::ChannelPending);
    qCInfo(lcSession) << employeeId << "authenticated, push channel on port" << m_pushListener->serverPort();
    respond(net::MessageTag::AuthResponse, QByteArray::number(m_pushListener->serverPort()));
}

void ClientSession::handleCreate(const QByteArray &body)
{
    const auto meeting = data::decodeMeeting(body);
    if (!meeting) {
        qCWarning(lcProtocol) << "Unreadable meeting in creation request from" << m_employeeId;
        respond(net::MessageTag::CreateMeetingResponse, net::encodeAcknowledgment(false));
        return;
    }
    const core::OperationResult result = m_context.service->createMeeting(*meeting);
    m_context.dispatcher->dispatch(result.notifications);
    respond(net::MessageTag::CreateMeetingResponse, net::encodeAcknowledgment(result.accepted));
}

void ClientSession::handleUpdate(const QByteArray &body)
{
    const auto meeting = data::decodeMeeting(body);
    if (!meeting) {
        qCWarning(lcProtocol) << "Unreadable meeting in update request from" << m_employeeId;
        respond(net::MessageTag::UpdateMeetingResponse, net::encodeAcknowledgment(false));
        return;
    }
    const core::OperationResult result = m_context.service->updateMeeting(*meeting);
    m_context.dispatcher->dispatch(result.notifications);
    respond(net::MessageTag::UpdateMeetingResponse, net::encodeAcknowledgment(result.accepted));
}

void ClientSession::handleDelete(const QByteArray &body)
{
    const auto meeting = data::decodeMeeting(body);
    if (!meeting) {
        qCWarning(lcProtocol) << "Unreadable meeting in deletion request from" << m_employeeId;
        respond(net::MessageTag::DeleteMeetingResponse, net::encodeAcknowledgment(false));
        return;
    }
    const core::OperationResult result = m_context.service->deleteMeeting(*meeting);
    m_context.dispatcher->dispatch(result.notifications);
    respond(net::MessageTag::DeleteMeetingResponse, net::encodeAcknowledgment(result.accepted));
}

void ClientSession::handleMeetingsById(const QByteArray &body)
{
    const QString employeeId = QString::fromUtf8(body).trimmed();
    if (employeeId.isEmpty()) {
        respond(net::MessageTag::MeetingsByIdResponse, data::encodeMeetingList({}));
        return;
    }
    respond(net::MessageTag::MeetingsByIdResponse, data::encodeMeetingList(m_context.service->meetingsFor(employeeId)));
}

void ClientSession::rejectUnauthenticated(const net::Message &message)
{
    qCWarning(lcSession) << "Rejecting" << net::tagName(message.tag) << "before authentication";
    switch (message.tag) {
    case net::MessageTag::CreateMeetingRequest:
        respond(net::MessageTag::CreateMeetingResponse, net::encodeAcknowledgment(false));
        break;
    case net::MessageTag::UpdateMeetingRequest:
        respond(net::MessageTag::UpdateMeetingResponse, net::encodeAcknowledgment(false));
        break;
    case net::MessageTag::DeleteMeetingRequest:
        respond(net::MessageTag::DeleteMeetingResponse, net::encodeAcknowledgment(false));
        break;
    case net::MessageTag::MeetingsByIdRequest:
        respond(net::MessageTag::MeetingsByIdResponse, data::encodeMeetingList({}));
        break;
    default:
        break;
    }
}

void ClientSession::respond(net::MessageTag tag, const QByteArray &body)
{
    if (m_state == State::Closed) {
        return;
    }
    if (!net::writeFrame(*m_socket, tag, body)) {
        close();
    }
}

void ClientSession::setState(State state)
{
    if (m_state == state) {
        return;
    }
    qCDebug(lcSession) << m_employeeId << m_state << "->" << state;
    m_state = state;
}

} // namespace server
} // namespace meetings
