#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include "meetings/data/Meeting.hpp"

namespace meetings {
namespace data {
class MeetingIndex;
}

namespace core {

// Returns true when `other` is considered to clash with `self`, where
// dStart = other.start - self.start, dEnd = other.end - self.end and
// dur = self.end - self.start:
//   identical         dStart == 0 && dEnd == 0
//   starts inside     dStart > 0 && dStart < dur
//   nested/trailing   dStart > 0 && dEnd < 0
// The predicate is not symmetric and does not flag `other` starting before
// `self`. Detection always passes the existing meeting as `self` and the
// causing meeting as `other`.
bool overlaps(const data::Meeting &self, const data::Meeting &other);

struct ConflictGroup
{
    data::Meeting causing;
    QVector<data::Meeting> affected;
};

// owner employee id -> ordered causing meetings -> de-duplicated affected list
class ConflictBuckets
{
public:
    bool add(const QString &ownerId, const data::Meeting &causing, const data::Meeting &affected);
    // Drops every group where the meeting (by identity key) is the causing
    // meeting and removes it from every affected list. Empty groups and empty
    // owners are pruned. Returns the ids of owners whose bucket changed.
    QStringList removeMeeting(const data::Meeting &meeting);
    void clear();

    QVector<ConflictGroup> groupsFor(const QString &ownerId) const;
    QVector<data::Meeting> affectedBy(const QString &ownerId, const data::Meeting &causing) const;
    bool hasGroup(const QString &ownerId, const data::Meeting &causing) const;
    bool references(const data::Meeting &meeting) const;
    QStringList owners() const;
    bool isEmpty() const;

private:
    QHash<QString, QVector<ConflictGroup>> m_buckets;
};

class ConflictEngine
{
public:
    // Bulk detection over every ordered pair of distinct meetings. Used when
    // persisted state is loaded.
    int detectAll(const QVector<data::Meeting> &meetings);
    // Incremental detection for a candidate against the organized and invited
    // meetings of its organizer and of each invitee. Returns the ids of the
    // employees that received at least one bucket entry.
    QStringList detectFor(const data::Meeting &candidate, const data::MeetingIndex &index);
    QStringList clearMeeting(const data::Meeting &meeting);
    void reset();

    const ConflictBuckets &buckets() const;

private:
    bool detectForEmployee(const QString &employeeId,
                           const data::Meeting &candidate,
                           const data::MeetingIndex &index);

    ConflictBuckets m_buckets;
};

} // namespace core
} // namespace meetings
