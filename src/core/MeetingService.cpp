#include "meetings/core/MeetingService.hpp"

#include <QMutexLocker>

#include "meetings/core/Logging.hpp"
#include "meetings/data/MeetingStorage.hpp"

namespace meetings {
namespace core {

namespace {
OperationResult rejected(const QString &reason)
{
    OperationResult result;
    result.reason = reason;
    return result;
}

QVector<Notification> notifyParticipants(const data::Meeting &meeting, NotificationKind kind)
{
    QVector<Notification> notifications;
    for (const QString &employeeId : data::participantIds(meeting)) {
        notifications.append(Notification{employeeId, kind, {meeting}});
    }
    return notifications;
}
} // namespace

MeetingService::MeetingService(std::shared_ptr<data::MeetingStorage> storage)
    : m_storage(std::move(storage))
{
}

MeetingService::~MeetingService() = default;

int MeetingService::load()
{
    QMutexLocker locker(&m_mutex);
    m_index.clear();
    m_conflicts.reset();
    if (!m_storage) {
        return 0;
    }

    QVector<data::Meeting> loaded;
    for (const data::Meeting &meeting : m_storage->loadAll()) {
        if (m_index.findByIdentity(meeting.organizer.id, meeting.topic, meeting.place)) {
            qCWarning(lcStore) << "Skipping duplicate stored meeting" << data::describe(meeting);
            continue;
        }
        m_index.insert(meeting);
        loaded.append(meeting);
    }
    m_conflicts.detectAll(loaded);
    return loaded.size();
}

OperationResult MeetingService::createMeeting(const data::Meeting &meeting)
{
    QString reason;
    if (!data::isValid(meeting, &reason)) {
        qCInfo(lcStore) << "Rejected creation of" << meeting.topic << ":" << reason;
        return rejected(reason);
    }

    QMutexLocker locker(&m_mutex);
    if (m_index.findByIdentity(meeting.organizer.id, meeting.topic, meeting.place)) {
        qCInfo(lcStore) << "Rejected duplicate meeting" << data::describe(meeting);
        return rejected(QStringLiteral("meeting already exists"));
    }

    const QStringList conflicted = m_conflicts.detectFor(meeting, m_index);
    m_index.insert(meeting);
    persistLocked();

    OperationResult result;
    result.accepted = true;
    if (!conflicted.isEmpty()) {
        result.notifications = conflictNotificationsLocked(meeting);
    }
    qCInfo(lcStore) << "Created" << data::describe(meeting);
    return result;
}

OperationResult MeetingService::updateMeeting(const data::Meeting &meeting)
{
    QString reason;
    if (!data::isValid(meeting, &reason)) {
        qCInfo(lcStore) << "Rejected update of" << meeting.topic << ":" << reason;
        return rejected(reason);
    }

    QMutexLocker locker(&m_mutex);
    if (!m_index.replace(meeting)) {
        qCInfo(lcStore) << "No meeting to update for" << data::describe(meeting);
        return rejected(QStringLiteral("meeting not found"));
    }

    m_conflicts.clearMeeting(meeting);
    const QStringList conflicted = m_conflicts.detectFor(meeting, m_index);
    persistLocked();

    OperationResult result;
    result.accepted = true;
    if (conflicted.isEmpty()) {
        result.notifications = notifyParticipants(meeting, NotificationKind::ConflictResolution);
    } else {
        result.notifications = conflictNotificationsLocked(meeting);
    }
    qCInfo(lcStore) << "Updated" << data::describe(meeting) << "conflicts:" << !conflicted.isEmpty();
    return result;
}

OperationResult MeetingService::deleteMeeting(const data::Meeting &meeting)
{
    if (meeting.organizer.id.isEmpty() || meeting.topic.isEmpty()) {
        return rejected(QStringLiteral("organizer and topic are required"));
    }

    QMutexLocker locker(&m_mutex);
    const auto removed = m_index.remove(meeting.organizer.id, meeting.topic);
    if (!removed) {
        qCInfo(lcStore) << "No meeting to delete for" << meeting.organizer.id << meeting.topic;
        return rejected(QStringLiteral("meeting not found"));
    }

    m_conflicts.clearMeeting(*removed);
    persistLocked();

    OperationResult result;
    result.accepted = true;
    result.notifications = notifyParticipants(*removed, NotificationKind::Deletion);
    qCInfo(lcStore) << "Deleted" << data::describe(*removed);
    return result;
}

QVector<data::Meeting> MeetingService::meetingsFor(const QString &employeeId) const
{
    QMutexLocker locker(&m_mutex);
    return m_index.meetingsFor(employeeId);
}

QVector<data::Meeting> MeetingService::allMeetings() const
{
    QMutexLocker locker(&m_mutex);
    return m_index.meetings();
}

QVector<ConflictGroup> MeetingService::conflictsFor(const QString &employeeId) const
{
    QMutexLocker locker(&m_mutex);
    return m_conflicts.buckets().groupsFor(employeeId);
}

QVector<Notification> MeetingService::pendingConflictsFor(const QString &employeeId) const
{
    QVector<Notification> notifications;
    for (const ConflictGroup &group : conflictsFor(employeeId)) {
        if (group.affected.isEmpty()) {
            continue;
        }
        Notification notification{employeeId, NotificationKind::ConflictUpdate, {group.causing}};
        notification.meetings += group.affected;
        notifications.append(notification);
    }
    return notifications;
}

bool MeetingService::referencedByConflicts(const data::Meeting &meeting) const
{
    QMutexLocker locker(&m_mutex);
    return m_conflicts.buckets().references(meeting);
}

bool MeetingService::isConsistent() const
{
    QMutexLocker locker(&m_mutex);
    return m_index.isConsistent();
}

void MeetingService::persistLocked()
{
    if (!m_storage) {
        return;
    }
    if (!m_storage->replaceAll(m_index.meetings())) {
        qCWarning(lcStore) << "Persisting" << m_index.size()
                           << "meetings failed; in-memory state stays authoritative";
    }
}

QVector<Notification> MeetingService::conflictNotificationsLocked(const data::Meeting &causing) const
{
    QVector<Notification> notifications;
    for (const QString &employeeId : data::participantIds(causing)) {
        const QVector<data::Meeting> affected = m_conflicts.buckets().affectedBy(employeeId, causing);
        if (affected.isEmpty()) {
            continue;
        }
        Notification notification{employeeId, NotificationKind::ConflictUpdate, {causing}};
        notification.meetings += affected;
        notifications.append(notification);
    }
    return notifications;
}

} // namespace core
} // namespace meetings
