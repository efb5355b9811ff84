#include "meetings/server/ServerSettings.hpp"

#include <QFileInfo>
#include <QSettings>

#include "meetings/core/Logging.hpp"

namespace meetings {
namespace server {

namespace {
void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}

bool readPort(const QVariant &value, quint16 *port)
{
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok || parsed < 0 || parsed > 65535) {
        return false;
    }
    *port = static_cast<quint16>(parsed);
    return true;
}
} // namespace

void ServerSettings::addAccount(ClientAccount account)
{
    const QString id = account.employeeId;
    accounts.insert(id, std::move(account));
}

bool ServerSettings::verify(const QString &employeeId, const QString &secret) const
{
    const auto it = accounts.constFind(employeeId);
    return it != accounts.constEnd() && it->secret == secret;
}

std::optional<quint16> ServerSettings::pushPortFor(const QString &employeeId) const
{
    const auto it = accounts.constFind(employeeId);
    if (it == accounts.constEnd()) {
        return std::nullopt;
    }
    return it->pushPort;
}

std::optional<ServerSettings> ServerSettings::fromFile(const QString &path, QString *error)
{
    if (!QFileInfo::exists(path)) {
        setError(error, QStringLiteral("configuration file %1 not found").arg(path));
        return std::nullopt;
    }

    QSettings file(path, QSettings::IniFormat);
    if (file.status() != QSettings::NoError) {
        setError(error, QStringLiteral("cannot parse %1").arg(path));
        return std::nullopt;
    }

    ServerSettings settings;
    file.beginGroup(QStringLiteral("server"));
    const QString address = file.value(QStringLiteral("address"), QStringLiteral("0.0.0.0")).toString();
    if (!settings.address.setAddress(address)) {
        setError(error, QStringLiteral("invalid server address %1").arg(address));
        return std::nullopt;
    }
    if (!readPort(file.value(QStringLiteral("port"), 8080), &settings.port)) {
        setError(error, QStringLiteral("invalid server port"));
        return std::nullopt;
    }
    bool backlogOk = false;
    settings.backlog = file.value(QStringLiteral("backlog"), 100).toInt(&backlogOk);
    if (!backlogOk || settings.backlog <= 0) {
        setError(error, QStringLiteral("invalid server backlog"));
        return std::nullopt;
    }
    settings.storagePath = file.value(QStringLiteral("storage"), settings.storagePath).toString();
    file.endGroup();

    const int count = file.beginReadArray(QStringLiteral("clients"));
    for (int i = 0; i < count; ++i) {
        file.setArrayIndex(i);
        ClientAccount account;
        account.employeeId = file.value(QStringLiteral("id")).toString();
        account.secret = file.value(QStringLiteral("password")).toString();
        if (account.employeeId.isEmpty() || account.secret.isEmpty()
            || !readPort(file.value(QStringLiteral("push_port"), 0), &account.pushPort)) {
            qCWarning(lcServer) << "Skipping incomplete client entry" << i << "in" << path;
            continue;
        }
        settings.addAccount(std::move(account));
    }
    file.endArray();

    qCInfo(lcServer) << "Loaded" << settings.accounts.size() << "client accounts from" << path;
    return settings;
}

} // namespace server
} // namespace meetings
