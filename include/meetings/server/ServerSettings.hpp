#pragma once

#include <QHash>
#include <QHostAddress>
#include <QString>
#include <optional>

namespace meetings {
namespace server {

struct ClientAccount
{
    QString employeeId;
    QString secret;
    quint16 pushPort = 0; // 0 lets the OS choose
};

struct ServerSettings
{
    QHostAddress address = QHostAddress::Any;
    quint16 port = 8080;
    int backlog = 100;
    QString storagePath = QStringLiteral("meetings.json");
    QHash<QString, ClientAccount> accounts;

    void addAccount(ClientAccount account);
    bool verify(const QString &employeeId, const QString &secret) const;
    std::optional<quint16> pushPortFor(const QString &employeeId) const;

    static std::optional<ServerSettings> fromFile(const QString &path, QString *error = nullptr);
};

} // namespace server
} // namespace meetings
