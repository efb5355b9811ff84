#include "meetings/client/ClientSettings.hpp"

#include <QFileInfo>
#include <QSettings>

#include "meetings/core/Logging.hpp"

namespace meetings {
namespace client {

namespace {
void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}
} // namespace

std::optional<ClientSettings> ClientSettings::fromFile(const QString &path, QString *error)
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

    ClientSettings settings;
    file.beginGroup(QStringLiteral("server"));
    settings.host = file.value(QStringLiteral("host"), settings.host).toString();
    bool portOk = false;
    const int port = file.value(QStringLiteral("port"), 8080).toInt(&portOk);
    if (!portOk || port <= 0 || port > 65535) {
        setError(error, QStringLiteral("invalid server port"));
        return std::nullopt;
    }
    settings.port = static_cast<quint16>(port);
    file.endGroup();

    file.beginGroup(QStringLiteral("client"));
    settings.employee.id = file.value(QStringLiteral("id")).toString();
    settings.employee.fullName = file.value(QStringLiteral("name")).toString();
    settings.secret = file.value(QStringLiteral("password")).toString();
    settings.storagePath = file.value(QStringLiteral("storage")).toString();
    bool timeoutOk = false;
    settings.timeoutMs = file.value(QStringLiteral("timeout_ms"), 5000).toInt(&timeoutOk);
    file.endGroup();

    if (settings.employee.id.isEmpty()) {
        setError(error, QStringLiteral("client id missing in %1").arg(path));
        return std::nullopt;
    }
    if (!timeoutOk || settings.timeoutMs <= 0) {
        setError(error, QStringLiteral("invalid timeout_ms"));
        return std::nullopt;
    }

    qCInfo(lcClient) << "Loaded client settings for" << settings.employee.id << "from" << path;
    return settings;
}

} // namespace client
} // namespace meetings
