#pragma once

#include <QString>
#include <optional>

#include "meetings/data/Meeting.hpp"

namespace meetings {
namespace client {

struct ClientSettings
{
    QString host = QStringLiteral("127.0.0.1");
    quint16 port = 8080;
    data::Employee employee;
    QString secret;
    QString storagePath; // empty keeps the cache in memory only
    int timeoutMs = 5000;

    static std::optional<ClientSettings> fromFile(const QString &path, QString *error = nullptr);
};

} // namespace client
} // namespace meetings
