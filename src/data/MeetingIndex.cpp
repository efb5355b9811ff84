#include "meetings/data/MeetingIndex.hpp"

#include <algorithm>

namespace meetings {
namespace data {

namespace {
int indexOfIdentity(const QVector<Meeting> &list, const Meeting &meeting)
{
    for (int i = 0; i < list.size(); ++i) {
        if (sameIdentity(list.at(i), meeting)) {
            return i;
        }
    }
    return -1;
}

int countEqual(const QVector<Meeting> &list, const Meeting &meeting)
{
    return static_cast<int>(std::count(list.cbegin(), list.cend(), meeting));
}
} // namespace

MeetingIndex::MeetingIndex() = default;
MeetingIndex::~MeetingIndex() = default;

void MeetingIndex::clear()
{
    m_organizerMeetings.clear();
    m_inviteeMeetings.clear();
    m_meetings.clear();
}

void MeetingIndex::insert(const Meeting &meeting)
{
    m_organizerMeetings[meeting.organizer.id].append(meeting);
    linkInvitees(meeting);
    rebuildCollection();
}

std::optional<Meeting> MeetingIndex::findByIdentity(const QString &organizerId,
                                                    const QString &topic,
                                                    const QString &place) const
{
    const auto it = m_organizerMeetings.constFind(organizerId);
    if (it == m_organizerMeetings.constEnd()) {
        return std::nullopt;
    }
    for (const Meeting &meeting : it.value()) {
        if (meeting.topic == topic && meeting.place == place) {
            return meeting;
        }
    }
    return std::nullopt;
}

std::optional<Meeting> MeetingIndex::findByOrganizerAndTopic(const QString &organizerId, const QString &topic) const
{
    const auto it = m_organizerMeetings.constFind(organizerId);
    if (it == m_organizerMeetings.constEnd()) {
        return std::nullopt;
    }
    for (const Meeting &meeting : it.value()) {
        if (meeting.topic == topic) {
            return meeting;
        }
    }
    return std::nullopt;
}

std::optional<Meeting> MeetingIndex::replace(const Meeting &meeting)
{
    auto it = m_organizerMeetings.find(meeting.organizer.id);
    if (it == m_organizerMeetings.end()) {
        return std::nullopt;
    }
    const int position = indexOfIdentity(it.value(), meeting);
    if (position < 0) {
        return std::nullopt;
    }

    const Meeting previous = it.value().at(position);
    it.value()[position] = meeting;
    unlinkInvitees(previous);
    linkInvitees(meeting);
    rebuildCollection();
    return previous;
}

std::optional<Meeting> MeetingIndex::remove(const QString &organizerId, const QString &topic)
{
    auto it = m_organizerMeetings.find(organizerId);
    if (it == m_organizerMeetings.end()) {
        return std::nullopt;
    }

    QVector<Meeting> &organized = it.value();
    std::optional<Meeting> removed;
    for (int i = 0; i < organized.size(); ++i) {
        if (organized.at(i).topic == topic) {
            removed = organized.takeAt(i);
            break;
        }
    }
    if (!removed) {
        return std::nullopt;
    }
    if (organized.isEmpty()) {
        m_organizerMeetings.erase(it);
    }

    unlinkInvitees(*removed);
    rebuildCollection();
    return removed;
}

QVector<Meeting> MeetingIndex::organizedBy(const QString &employeeId) const
{
    return m_organizerMeetings.value(employeeId);
}

QVector<Meeting> MeetingIndex::invitedTo(const QString &employeeId) const
{
    return m_inviteeMeetings.value(employeeId);
}

QVector<Meeting> MeetingIndex::meetingsFor(const QString &employeeId) const
{
    QVector<Meeting> result = organizedBy(employeeId);
    for (const Meeting &meeting : m_inviteeMeetings.value(employeeId)) {
        if (indexOfIdentity(result, meeting) < 0 && hasParticipant(meeting, employeeId)) {
            result.append(meeting);
        }
    }
    return result;
}

const QVector<Meeting> &MeetingIndex::meetings() const
{
    return m_meetings;
}

int MeetingIndex::size() const
{
    return m_meetings.size();
}

bool MeetingIndex::isConsistent() const
{
    int organizerEntries = 0;
    for (auto it = m_organizerMeetings.constBegin(); it != m_organizerMeetings.constEnd(); ++it) {
        if (it.value().isEmpty()) {
            return false;
        }
        organizerEntries += it.value().size();
    }
    int inviteeEntries = 0;
    for (auto it = m_inviteeMeetings.constBegin(); it != m_inviteeMeetings.constEnd(); ++it) {
        if (it.value().isEmpty()) {
            return false;
        }
        inviteeEntries += it.value().size();
    }

    int expectedInviteeEntries = 0;
    for (const Meeting &meeting : m_meetings) {
        if (countEqual(m_organizerMeetings.value(meeting.organizer.id), meeting) != 1) {
            return false;
        }
        for (const Employee &invitee : meeting.invitees) {
            if (countEqual(m_inviteeMeetings.value(invitee.id), meeting) != 1) {
                return false;
            }
        }
        expectedInviteeEntries += meeting.invitees.size();
    }
    return organizerEntries == m_meetings.size() && inviteeEntries == expectedInviteeEntries;
}

void MeetingIndex::unlinkInvitees(const Meeting &meeting)
{
    for (const Employee &invitee : meeting.invitees) {
        auto it = m_inviteeMeetings.find(invitee.id);
        if (it == m_inviteeMeetings.end()) {
            continue;
        }
        const int position = indexOfIdentity(it.value(), meeting);
        if (position >= 0) {
            it.value().removeAt(position);
        }
        if (it.value().isEmpty()) {
            m_inviteeMeetings.erase(it);
        }
    }
}

void MeetingIndex::linkInvitees(const Meeting &meeting)
{
    for (const Employee &invitee : meeting.invitees) {
        QVector<Meeting> &invited = m_inviteeMeetings[invitee.id];
        if (indexOfIdentity(invited, meeting) < 0) {
            invited.append(meeting);
        }
    }
}

void MeetingIndex::rebuildCollection()
{
    m_meetings.clear();
    for (auto it = m_organizerMeetings.constBegin(); it != m_organizerMeetings.constEnd(); ++it) {
        m_meetings.append(it.value());
    }
    std::stable_sort(m_meetings.begin(), m_meetings.end(), [](const Meeting &lhs, const Meeting &rhs) {
        if (lhs.start != rhs.start) {
            return lhs.start < rhs.start;
        }
        if (lhs.organizer.id != rhs.organizer.id) {
            return lhs.organizer.id < rhs.organizer.id;
        }
        return lhs.topic < rhs.topic;
    });
}

} // namespace data
} // namespace meetings
