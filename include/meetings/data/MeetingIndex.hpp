#pragma once

#include <QHash>
#include <QString>
#include <QVector>
#include <optional>

#include "meetings/data/Meeting.hpp"

namespace meetings {
namespace data {

// Authoritative server-side meeting store. Every meeting is listed once under
// its organizer and once under each invitee; meetings() is the flat collection
// rebuilt from the organizer index after every mutation.
class MeetingIndex
{
public:
    MeetingIndex();
    ~MeetingIndex();

    void clear();
    void insert(const Meeting &meeting);

    std::optional<Meeting> findByIdentity(const QString &organizerId,
                                          const QString &topic,
                                          const QString &place) const;
    std::optional<Meeting> findByOrganizerAndTopic(const QString &organizerId, const QString &topic) const;

    // Swaps the stored meeting with the same identity key in place and
    // re-links the invitee lists. Returns the previous value.
    std::optional<Meeting> replace(const Meeting &meeting);
    std::optional<Meeting> remove(const QString &organizerId, const QString &topic);

    QVector<Meeting> organizedBy(const QString &employeeId) const;
    QVector<Meeting> invitedTo(const QString &employeeId) const;
    QVector<Meeting> meetingsFor(const QString &employeeId) const;

    const QVector<Meeting> &meetings() const;
    int size() const;
    bool isConsistent() const;

private:
    void unlinkInvitees(const Meeting &meeting);
    void linkInvitees(const Meeting &meeting);
    void rebuildCollection();

    QHash<QString, QVector<Meeting>> m_organizerMeetings;
    QHash<QString, QVector<Meeting>> m_inviteeMeetings;
    QVector<Meeting> m_meetings;
};

} // namespace data
} // namespace meetings
