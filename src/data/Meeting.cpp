#include "meetings/data/Meeting.hpp"

#include <QSet>
#include <QStringList>

namespace meetings {
namespace data {

namespace {
bool fail(QString *reason, const QString &message)
{
    if (reason) {
        *reason = message;
    }
    return false;
}
} // namespace

bool operator==(const Employee &lhs, const Employee &rhs)
{
    return lhs.id == rhs.id && lhs.fullName.compare(rhs.fullName, Qt::CaseInsensitive) == 0;
}

bool operator!=(const Employee &lhs, const Employee &rhs)
{
    return !(lhs == rhs);
}

bool operator==(const Meeting &lhs, const Meeting &rhs)
{
    return lhs.topic == rhs.topic
        && lhs.organizer == rhs.organizer
        && lhs.invitees == rhs.invitees
        && lhs.place == rhs.place
        && lhs.start == rhs.start
        && lhs.end == rhs.end;
}

bool operator!=(const Meeting &lhs, const Meeting &rhs)
{
    return !(lhs == rhs);
}

bool sameIdentity(const Meeting &lhs, const Meeting &rhs)
{
    return lhs.organizer.id == rhs.organizer.id
        && lhs.topic == rhs.topic
        && lhs.place == rhs.place;
}

bool sameOrganizerAndTopic(const Meeting &lhs, const Meeting &rhs)
{
    return lhs.organizer.id == rhs.organizer.id && lhs.topic == rhs.topic;
}

bool hasParticipant(const Meeting &meeting, const QString &employeeId)
{
    if (meeting.organizer.id == employeeId) {
        return true;
    }
    for (const Employee &invitee : meeting.invitees) {
        if (invitee.id == employeeId) {
            return true;
        }
    }
    return false;
}

QStringList participantIds(const Meeting &meeting)
{
    QStringList ids;
    ids.reserve(meeting.invitees.size() + 1);
    ids << meeting.organizer.id;
    for (const Employee &invitee : meeting.invitees) {
        ids << invitee.id;
    }
    return ids;
}

bool isValid(const Meeting &meeting, QString *reason)
{
    if (meeting.topic.isEmpty()) {
        return fail(reason, QStringLiteral("meeting topic is empty"));
    }
    if (meeting.place.isEmpty()) {
        return fail(reason, QStringLiteral("meeting place is empty"));
    }
    if (meeting.organizer.id.isEmpty()) {
        return fail(reason, QStringLiteral("organizer id is empty"));
    }
    if (!meeting.start.isValid() || !meeting.end.isValid()) {
        return fail(reason, QStringLiteral("meeting times are missing"));
    }
    if (meeting.end <= meeting.start) {
        return fail(reason, QStringLiteral("meeting must end after it starts"));
    }

    QSet<QString> seen;
    for (const Employee &invitee : meeting.invitees) {
        if (invitee.id.isEmpty()) {
            return fail(reason, QStringLiteral("invitee id is empty"));
        }
        if (invitee.id == meeting.organizer.id) {
            return fail(reason, QStringLiteral("organizer %1 cannot be an invitee").arg(invitee.id));
        }
        if (seen.contains(invitee.id)) {
            return fail(reason, QStringLiteral("invitee %1 listed twice").arg(invitee.id));
        }
        seen.insert(invitee.id);
    }
    return true;
}

QDateTime fromEpochMilliseconds(qint64 value)
{
    return QDateTime::fromMSecsSinceEpoch(value, Qt::UTC);
}

QString describe(const Meeting &meeting)
{
    return QStringLiteral("%1 @ %2 by %3 [%4 - %5]")
        .arg(meeting.topic, meeting.place, meeting.organizer.id,
             meeting.start.toUTC().toString(Qt::ISODateWithMs),
             meeting.end.toUTC().toString(Qt::ISODateWithMs));
}

} // namespace data
} // namespace meetings
