#pragma once

#include <QObject>
#include <QVector>
#include <memory>

#include "meetings/data/Meeting.hpp"

namespace meetings {
namespace data {
class MeetingStorage;
}

namespace client {

// Client-side view of the employee's meetings plus the queue of conflicts the
// server pushed. The optional storage mirrors the meeting list on disk.
class ClientReconciler : public QObject
{
    Q_OBJECT

public:
    explicit ClientReconciler(std::shared_ptr<data::MeetingStorage> storage = nullptr, QObject *parent = nullptr);

    const QVector<data::Meeting> &meetings() const;
    QVector<data::Meeting> pendingConflicts() const;
    void clearPendingConflicts();

    void mergeMeetings(const QVector<data::Meeting> &meetings);

    void applyConflict(const data::Meeting &meeting);
    void applyResolution(const data::Meeting &meeting);
    void applyDeletion(const data::Meeting &meeting);

    void recordCreated(const data::Meeting &meeting);
    void recordUpdated(const data::Meeting &meeting);
    void recordDeleted(const data::Meeting &meeting);

signals:
    void meetingsChanged();
    void conflictReceived(const meetings::data::Meeting &meeting);
    void conflictResolved(const meetings::data::Meeting &meeting);
    void meetingDeleted(const meetings::data::Meeting &meeting);

private:
    void dropPending(const data::Meeting &meeting);
    void persist();

    std::shared_ptr<data::MeetingStorage> m_storage;
    QVector<data::Meeting> m_meetings;
    QVector<data::Meeting> m_pendingConflicts;
};

} // namespace client
} // namespace meetings
