#include "meetings/core/ConflictEngine.hpp"

#include "meetings/core/Logging.hpp"
#include "meetings/data/MeetingIndex.hpp"

#include <algorithm>

namespace meetings {
namespace core {

bool overlaps(const data::Meeting &self, const data::Meeting &other)
{
    const qint64 startDelta = other.start.toMSecsSinceEpoch() - self.start.toMSecsSinceEpoch();
    const qint64 endDelta = other.end.toMSecsSinceEpoch() - self.end.toMSecsSinceEpoch();
    const qint64 duration = self.end.toMSecsSinceEpoch() - self.start.toMSecsSinceEpoch();

    const bool identical = startDelta == 0 && endDelta == 0;
    const bool startsInside = startDelta > 0 && startDelta < duration;
    const bool nestedOrTrailing = startDelta > 0 && endDelta < 0;
    return identical || startsInside || nestedOrTrailing;
}

bool ConflictBuckets::add(const QString &ownerId, const data::Meeting &causing, const data::Meeting &affected)
{
    QVector<ConflictGroup> &groups = m_buckets[ownerId];
    for (ConflictGroup &group : groups) {
        if (group.causing == causing) {
            if (group.affected.contains(affected)) {
                return false;
            }
            group.affected.append(affected);
            return true;
        }
    }
    groups.append(ConflictGroup{causing, {affected}});
    return true;
}

QStringList ConflictBuckets::removeMeeting(const data::Meeting &meeting)
{
    QStringList changed;
    for (auto it = m_buckets.begin(); it != m_buckets.end();) {
        QVector<ConflictGroup> &groups = it.value();
        const int before = groups.size();
        bool touched = false;

        for (int i = groups.size() - 1; i >= 0; --i) {
            ConflictGroup &group = groups[i];
            if (data::sameIdentity(group.causing, meeting)) {
                groups.removeAt(i);
                continue;
            }
            const int affectedBefore = group.affected.size();
            group.affected.erase(std::remove_if(group.affected.begin(), group.affected.end(),
                                                [&meeting](const data::Meeting &affected) {
                                                    return data::sameIdentity(affected, meeting);
                                                }),
                                 group.affected.end());
            if (group.affected.size() != affectedBefore) {
                touched = true;
            }
            if (group.affected.isEmpty()) {
                groups.removeAt(i);
            }
        }

        if (touched || groups.size() != before) {
            changed << it.key();
        }
        if (groups.isEmpty()) {
            it = m_buckets.erase(it);
        } else {
            ++it;
        }
    }
    return changed;
}

void ConflictBuckets::clear()
{
    m_buckets.clear();
}

QVector<ConflictGroup> ConflictBuckets::groupsFor(const QString &ownerId) const
{
    return m_buckets.value(ownerId);
}

QVector<data::Meeting> ConflictBuckets::affectedBy(const QString &ownerId, const data::Meeting &causing) const
{
    const auto it = m_buckets.constFind(ownerId);
    if (it == m_buckets.constEnd()) {
        return {};
    }
    for (const ConflictGroup &group : it.value()) {
        if (group.causing == causing) {
            return group.affected;
        }
    }
    return {};
}

bool ConflictBuckets::hasGroup(const QString &ownerId, const data::Meeting &causing) const
{
    return !affectedBy(ownerId, causing).isEmpty();
}

bool ConflictBuckets::references(const data::Meeting &meeting) const
{
    for (auto it = m_buckets.constBegin(); it != m_buckets.constEnd(); ++it) {
        for (const ConflictGroup &group : it.value()) {
            if (data::sameIdentity(group.causing, meeting)) {
                return true;
            }
            for (const data::Meeting &affected : group.affected) {
                if (data::sameIdentity(affected, meeting)) {
                    return true;
                }
            }
        }
    }
    return false;
}

QStringList ConflictBuckets::owners() const
{
    return m_buckets.keys();
}

bool ConflictBuckets::isEmpty() const
{
    return m_buckets.isEmpty();
}

int ConflictEngine::detectAll(const QVector<data::Meeting> &meetings)
{
    int recorded = 0;
    for (int i = 0; i < meetings.size(); ++i) {
        const data::Meeting &causing = meetings.at(i);
        for (int j = 0; j < meetings.size(); ++j) {
            if (i == j) {
                continue;
            }
            const data::Meeting &other = meetings.at(j);
            if (!overlaps(other, causing)) {
                continue;
            }
            for (const QString &ownerId : data::participantIds(causing)) {
                if (m_buckets.add(ownerId, causing, other)) {
                    ++recorded;
                }
            }
        }
    }
    qCInfo(lcConflicts) << "Bulk detection recorded" << recorded << "conflict entries";
    return recorded;
}

QStringList ConflictEngine::detectFor(const data::Meeting &candidate, const data::MeetingIndex &index)
{
    QStringList affectedEmployees;
    for (const QString &employeeId : data::participantIds(candidate)) {
        if (detectForEmployee(employeeId, candidate, index)) {
            affectedEmployees << employeeId;
        }
    }
    if (!affectedEmployees.isEmpty()) {
        qCInfo(lcConflicts) << data::describe(candidate) << "conflicts for" << affectedEmployees;
    }
    return affectedEmployees;
}

QStringList ConflictEngine::clearMeeting(const data::Meeting &meeting)
{
    const QStringList changed = m_buckets.removeMeeting(meeting);
    if (!changed.isEmpty()) {
        qCDebug(lcConflicts) << "Cleared" << meeting.topic << "from buckets of" << changed;
    }
    return changed;
}

void ConflictEngine::reset()
{
    m_buckets.clear();
}

const ConflictBuckets &ConflictEngine::buckets() const
{
    return m_buckets;
}

bool ConflictEngine::detectForEmployee(const QString &employeeId,
                                       const data::Meeting &candidate,
                                       const data::MeetingIndex &index)
{
    QVector<data::Meeting> existing = index.organizedBy(employeeId);
    existing += index.invitedTo(employeeId);

    bool found = false;
    for (const data::Meeting &meeting : existing) {
        if (data::sameIdentity(meeting, candidate)) {
            continue;
        }
        if (overlaps(meeting, candidate)) {
            m_buckets.add(employeeId, candidate, meeting);
            found = true;
        }
    }
    return found;
}

} // namespace core
} // namespace meetings
