#include "meetings/client/MeetingClient.hpp"

#include <QEventLoop>
#include <QTimer>

#include "meetings/core/Logging.hpp"
#include "meetings/data/MeetingJson.hpp"
#include "meetings/data/MeetingStorage.hpp"

namespace meetings {
namespace client {

MeetingClient::MeetingClient(ClientSettings settings, std::shared_ptr<data::MeetingStorage> cache, QObject *parent)
    : QObject(parent)
    , m_settings(std::move(settings))
    , m_reconciler(std::move(cache))
    , m_reader(&m_socket)
    , m_pushReader(&m_pushSocket)
{
    connect(&m_pushSocket, &QTcpSocket::readyRead, this, &MeetingClient::onPushReadyRead);
    connect(&m_socket, &QTcpSocket::disconnected, this, &MeetingClient::onTransportClosed);
    connect(&m_pushSocket, &QTcpSocket::disconnected, this, &MeetingClient::onPushClosed);
}

MeetingClient::~MeetingClient()
{
    m_socket.disconnect(this);
    m_pushSocket.disconnect(this);
    m_pushSocket.abort();
    m_socket.abort();
}

bool MeetingClient::connectToServer()
{
    if (isConnected()) {
        return true;
    }
    m_socket.connectToHost(m_settings.host, m_settings.port);
    waitUntil([this]() {
        return m_socket.state() == QAbstractSocket::ConnectedState
            || m_socket.state() == QAbstractSocket::UnconnectedState;
    });
    if (m_socket.state() != QAbstractSocket::ConnectedState) {
        qCWarning(lcClient) << "Cannot connect to" << m_settings.host << m_settings.port << m_socket.errorString();
        m_socket.abort();
        return false;
    }
    qCInfo(lcClient) << "Connected to" << m_settings.host << m_settings.port;
    return true;
}

bool MeetingClient::authenticate()
{
    return authenticate(m_settings.employee, m_settings.secret);
}

bool MeetingClient::authenticate(const data::Employee &employee, const QString &secret)
{
    if (m_authenticated) {
        qCWarning(lcClient) << "Already authenticated as" << m_employee.id;
        return false;
    }

    data::Credentials credentials;
    credentials.employee = employee;
    credentials.secret = secret;
    const auto body = request(net::MessageTag::AuthRequest, data::encodeCredentials(credentials),
                              net::MessageTag::AuthResponse);
    if (!body) {
        return false;
    }

    bool ok = false;
    const int port = QString::fromUtf8(*body).trimmed().toInt(&ok);
    if (!ok || port <= 0 || port > 65535) {
        qCWarning(lcClient) << "Authentication rejected for" << employee.id;
        return false;
    }
    if (!openPushChannel(static_cast<quint16>(port))) {
        disconnectFromServer();
        return false;
    }

    m_employee = employee;
    m_authenticated = true;
    qCInfo(lcClient) << "Authenticated as" << employee.id << "push port" << port;
    return true;
}

bool MeetingClient::createMeeting(const data::Meeting &meeting)
{
    if (!sendMeeting(net::MessageTag::CreateMeetingRequest, net::MessageTag::CreateMeetingResponse, meeting)) {
        return false;
    }
    m_reconciler.recordCreated(meeting);
    return true;
}

bool MeetingClient::updateMeeting(const data::Meeting &meeting)
{
    if (!sendMeeting(net::MessageTag::UpdateMeetingRequest, net::MessageTag::UpdateMeetingResponse, meeting)) {
        return false;
    }
    m_reconciler.recordUpdated(meeting);
    return true;
}

bool MeetingClient::deleteMeeting(const data::Meeting &meeting)
{
    if (!sendMeeting(net::MessageTag::DeleteMeetingRequest, net::MessageTag::DeleteMeetingResponse, meeting)) {
        return false;
    }
    m_reconciler.recordDeleted(meeting);
    return true;
}

std::optional<QVector<data::Meeting>> MeetingClient::fetchMeetings()
{
    return fetchMeetings(m_employee.id);
}

std::optional<QVector<data::Meeting>> MeetingClient::fetchMeetings(const QString &employeeId)
{
    if (!m_authenticated) {
        qCWarning(lcClient) << "Not authenticated, cannot fetch meetings";
        return std::nullopt;
    }
    const auto body = request(net::MessageTag::MeetingsByIdRequest, employeeId.toUtf8(),
                              net::MessageTag::MeetingsByIdResponse);
    if (!body) {
        return std::nullopt;
    }
    const auto meetings = data::decodeMeetingList(*body);
    if (!meetings) {
        qCWarning(lcClient) << "Unreadable meeting list for" << employeeId;
        return std::nullopt;
    }
    if (employeeId == m_employee.id) {
        m_reconciler.mergeMeetings(*meetings);
    }
    return meetings;
}

void MeetingClient::disconnectFromServer()
{
    m_authenticated = false;
    m_pushSocket.disconnectFromHost();
    m_socket.disconnectFromHost();
}

bool MeetingClient::isConnected() const
{
    return m_socket.state() == QAbstractSocket::ConnectedState;
}

bool MeetingClient::isAuthenticated() const
{
    return m_authenticated;
}

bool MeetingClient::hasPushChannel() const
{
    return m_pushSocket.state() == QAbstractSocket::ConnectedState;
}

const data::Employee &MeetingClient::currentEmployee() const
{
    return m_employee;
}

const ClientSettings &MeetingClient::settings() const
{
    return m_settings;
}

ClientReconciler &MeetingClient::reconciler()
{
    return m_reconciler;
}

const ClientReconciler &MeetingClient::reconciler() const
{
    return m_reconciler;
}

void MeetingClient::onPushReadyRead()
{
    for (;;) {
        net::Message message;
        switch (m_pushReader.read(&message)) {
        case net::FrameReader::Status::Incomplete:
            return;
        case net::FrameReader::Status::Dropped:
            continue;
        case net::FrameReader::Status::Corrupt:
            qCWarning(lcClient) << "Corrupt push frame, closing connection";
            disconnectFromServer();
            return;
        case net::FrameReader::Status::Frame:
            handlePush(message);
            break;
        }
    }
}

void MeetingClient::onTransportClosed()
{
    m_authenticated = false;
    if (m_pushSocket.state() != QAbstractSocket::UnconnectedState) {
        m_pushSocket.disconnectFromHost();
    }
    qCInfo(lcClient) << "Connection closed";
    emit disconnected();
}

void MeetingClient::onPushClosed()
{
    // A lost push channel ends the session.
    if (m_socket.state() == QAbstractSocket::ConnectedState) {
        qCInfo(lcClient) << "Push channel closed by server";
        m_socket.disconnectFromHost();
    }
}

bool MeetingClient::waitUntil(const std::function<bool()> &done)
{
    if (done()) {
        return true;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    connect(&m_socket, &QTcpSocket::readyRead, &loop, &QEventLoop::quit);
    connect(&m_socket, &QTcpSocket::stateChanged, &loop, &QEventLoop::quit);
    connect(&m_pushSocket, &QTcpSocket::stateChanged, &loop, &QEventLoop::quit);
    timer.start(m_settings.timeoutMs);

    while (!done()) {
        if (!timer.isActive()) {
            return false;
        }
        loop.exec();
    }
    return true;
}

std::optional<net::Message> MeetingClient::readResponse()
{
    std::optional<net::Message> response;
    bool broken = false;
    const bool finished = waitUntil([this, &response, &broken]() {
        for (;;) {
            net::Message message;
            switch (m_reader.read(&message)) {
            case net::FrameReader::Status::Frame:
                response = message;
                return true;
            case net::FrameReader::Status::Dropped:
                continue;
            case net::FrameReader::Status::Corrupt:
                broken = true;
                return true;
            case net::FrameReader::Status::Incomplete:
                if (m_socket.state() != QAbstractSocket::ConnectedState) {
                    broken = true;
                    return true;
                }
                return false;
            }
        }
    });

    if (!finished) {
        qCWarning(lcClient) << "No response within" << m_settings.timeoutMs << "ms";
        return std::nullopt;
    }
    if (broken) {
        qCWarning(lcClient) << "Connection lost while waiting for a response";
        disconnectFromServer();
        return std::nullopt;
    }
    return response;
}

std::optional<QByteArray> MeetingClient::request(net::MessageTag tag, const QByteArray &body, net::MessageTag expected)
{
    if (!isConnected()) {
        qCWarning(lcClient) << "Not connected, dropping" << net::tagName(tag);
        return std::nullopt;
    }
    if (!net::writeFrame(m_socket, tag, body)) {
        return std::nullopt;
    }

    for (;;) {
        const auto response = readResponse();
        if (!response) {
            return std::nullopt;
        }
        if (response->tag == expected) {
            return response->body;
        }
        qCWarning(lcClient) << "Ignoring" << net::tagName(response->tag) << "while waiting for" << net::tagName(expected);
    }
}

bool MeetingClient::sendMeeting(net::MessageTag tag, net::MessageTag expected, const data::Meeting &meeting)
{
    if (!m_authenticated) {
        qCWarning(lcClient) << "Not authenticated, cannot send" << net::tagName(tag);
        return false;
    }
    const auto body = request(tag, data::encodeMeeting(meeting), expected);
    if (!body) {
        return false;
    }
    const bool accepted = net::parseAcknowledgment(*body);
    if (!accepted) {
        qCInfo(lcClient) << "Server rejected" << net::tagName(tag) << data::describe(meeting);
    }
    return accepted;
}

bool MeetingClient::openPushChannel(quint16 port)
{
    m_pushSocket.connectToHost(m_socket.peerAddress(), port);
    waitUntil([this]() {
        return m_pushSocket.state() == QAbstractSocket::ConnectedState
            || m_pushSocket.state() == QAbstractSocket::UnconnectedState;
    });
    if (m_pushSocket.state() != QAbstractSocket::ConnectedState) {
        qCWarning(lcClient) << "Cannot open push channel on port" << port << m_pushSocket.errorString();
        m_pushSocket.abort();
        return false;
    }
    return true;
}

void MeetingClient::handlePush(const net::Message &message)
{
    const auto meeting = data::decodeMeeting(message.body);
    if (!meeting) {
        qCWarning(lcClient) << "Unreadable meeting in" << net::tagName(message.tag);
        return;
    }
    switch (message.tag) {
    case net::MessageTag::ConflictUpdate:
        m_reconciler.applyConflict(*meeting);
        break;
    case net::MessageTag::ConflictResolution:
        m_reconciler.applyResolution(*meeting);
        break;
    case net::MessageTag::DeletionNotification:
        m_reconciler.applyDeletion(*meeting);
        break;
    default:
        qCWarning(lcClient) << "Unexpected push" << net::tagName(message.tag);
        break;
    }
}

} // namespace client
} // namespace meetings
