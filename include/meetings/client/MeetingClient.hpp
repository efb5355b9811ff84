#pragma once

#include <QObject>
#include <QTcpSocket>
#include <QVector>
#include <functional>
#include <memory>
#include <optional>

#include "meetings/client/ClientReconciler.hpp"
#include "meetings/client/ClientSettings.hpp"
#include "meetings/net/FrameCodec.hpp"

namespace meetings {
namespace data {
class MeetingStorage;
}

namespace client {

// Blocking-style client API. Every request waits for its response inside a
// local event loop, so pushes keep arriving while a request is in flight.
class MeetingClient : public QObject
{
    Q_OBJECT

public:
    explicit MeetingClient(ClientSettings settings, std::shared_ptr<data::MeetingStorage> cache = nullptr,
                           QObject *parent = nullptr);
    ~MeetingClient() override;

    bool connectToServer();
    bool authenticate();
    bool authenticate(const data::Employee &employee, const QString &secret);

    bool createMeeting(const data::Meeting &meeting);
    bool updateMeeting(const data::Meeting &meeting);
    bool deleteMeeting(const data::Meeting &meeting);
    std::optional<QVector<data::Meeting>> fetchMeetings();
    std::optional<QVector<data::Meeting>> fetchMeetings(const QString &employeeId);

    void disconnectFromServer();

    bool isConnected() const;
    bool isAuthenticated() const;
    bool hasPushChannel() const;
    const data::Employee &currentEmployee() const;
    const ClientSettings &settings() const;

    ClientReconciler &reconciler();
    const ClientReconciler &reconciler() const;

signals:
    void disconnected();

private slots:
    void onPushReadyRead();
    void onTransportClosed();
    void onPushClosed();

private:
    bool waitUntil(const std::function<bool()> &done);
    std::optional<net::Message> readResponse();
    std::optional<QByteArray> request(net::MessageTag tag, const QByteArray &body, net::MessageTag expected);
    bool sendMeeting(net::MessageTag tag, net::MessageTag expected, const data::Meeting &meeting);
    bool openPushChannel(quint16 port);
    void handlePush(const net::Message &message);

    ClientSettings m_settings;
    ClientReconciler m_reconciler;
    QTcpSocket m_socket;
    QTcpSocket m_pushSocket;
    net::FrameReader m_reader;
    net::FrameReader m_pushReader;
    data::Employee m_employee;
    bool m_authenticated = false;
};

} // namespace client
} // namespace meetings
