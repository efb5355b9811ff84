#pragma once

#include <QMutex>
#include <QString>
#include <QVector>
#include <memory>

#include "meetings/core/ConflictEngine.hpp"
#include "meetings/core/Notification.hpp"
#include "meetings/data/Meeting.hpp"
#include "meetings/data/MeetingIndex.hpp"

namespace meetings {
namespace data {
class MeetingStorage;
}

namespace core {

struct OperationResult
{
    bool accepted = false;
    QString reason;
    QVector<Notification> notifications;
};

// Owns the meeting index, the conflict buckets and persistence. Every public
// operation runs under one lock so the derived structures change together.
class MeetingService
{
public:
    explicit MeetingService(std::shared_ptr<data::MeetingStorage> storage);
    ~MeetingService();

    MeetingService(const MeetingService &) = delete;
    MeetingService &operator=(const MeetingService &) = delete;

    int load();

    OperationResult createMeeting(const data::Meeting &meeting);
    OperationResult updateMeeting(const data::Meeting &meeting);
    OperationResult deleteMeeting(const data::Meeting &meeting);

    QVector<data::Meeting> meetingsFor(const QString &employeeId) const;
    QVector<data::Meeting> allMeetings() const;
    QVector<ConflictGroup> conflictsFor(const QString &employeeId) const;
    QVector<Notification> pendingConflictsFor(const QString &employeeId) const;
    bool referencedByConflicts(const data::Meeting &meeting) const;
    bool isConsistent() const;

private:
    void persistLocked();
    QVector<Notification> conflictNotificationsLocked(const data::Meeting &causing) const;

    mutable QMutex m_mutex;
    std::shared_ptr<data::MeetingStorage> m_storage;
    data::MeetingIndex m_index;
    ConflictEngine m_conflicts;
};

} // namespace core
} // namespace meetings
