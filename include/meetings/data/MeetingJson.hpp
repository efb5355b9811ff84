#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QVector>
#include <optional>

#include "meetings/data/Meeting.hpp"

namespace meetings {
namespace data {

struct Credentials
{
    Employee employee;
    QString secret;
};

QJsonObject meetingToJson(const Meeting &meeting);
std::optional<Meeting> meetingFromJson(const QJsonObject &object);

QByteArray encodeMeeting(const Meeting &meeting);
std::optional<Meeting> decodeMeeting(const QByteArray &document);

QByteArray encodeMeetingList(const QVector<Meeting> &meetings);
std::optional<QVector<Meeting>> decodeMeetingList(const QByteArray &document);

QByteArray encodeCredentials(const Credentials &credentials);
// Accepts the dedicated credential document as well as the legacy form that
// reuses the meeting schema (organizer = identity, topic = secret).
std::optional<Credentials> decodeCredentials(const QByteArray &document);

} // namespace data
} // namespace meetings
