#include "meetings/client/ClientReconciler.hpp"

#include <algorithm>

#include "meetings/core/Logging.hpp"
#include "meetings/data/MeetingStorage.hpp"

namespace meetings {
namespace client {

ClientReconciler::ClientReconciler(std::shared_ptr<data::MeetingStorage> storage, QObject *parent)
    : QObject(parent)
    , m_storage(std::move(storage))
{
    if (m_storage) {
        m_meetings = m_storage->loadAll();
        qCInfo(lcClient) << "Loaded" << m_meetings.size() << "cached meetings";
    }
}

const QVector<data::Meeting> &ClientReconciler::meetings() const
{
    return m_meetings;
}

QVector<data::Meeting> ClientReconciler::pendingConflicts() const
{
    return m_pendingConflicts;
}

void ClientReconciler::clearPendingConflicts()
{
    m_pendingConflicts.clear();
}

void ClientReconciler::mergeMeetings(const QVector<data::Meeting> &meetings)
{
    for (const data::Meeting &meeting : meetings) {
        const auto it = std::find_if(m_meetings.begin(), m_meetings.end(), [&meeting](const data::Meeting &cached) {
            return data::sameIdentity(cached, meeting);
        });
        if (it != m_meetings.end()) {
            *it = meeting;
        } else {
            m_meetings.append(meeting);
        }
    }
    persist();
    emit meetingsChanged();
}

void ClientReconciler::applyConflict(const data::Meeting &meeting)
{
    if (!m_pendingConflicts.contains(meeting)) {
        m_pendingConflicts.append(meeting);
    }
    qCInfo(lcClient) << "Conflict:" << data::describe(meeting);
    emit conflictReceived(meeting);
}

void ClientReconciler::applyResolution(const data::Meeting &meeting)
{
    dropPending(meeting);
    qCInfo(lcClient) << "Conflict resolved:" << data::describe(meeting);
    emit conflictResolved(meeting);
}

void ClientReconciler::applyDeletion(const data::Meeting &meeting)
{
    dropPending(meeting);
    const int before = m_meetings.size();
    m_meetings.erase(std::remove_if(m_meetings.begin(), m_meetings.end(),
                                    [&meeting](const data::Meeting &cached) {
                                        return data::sameOrganizerAndTopic(cached, meeting);
                                    }),
                     m_meetings.end());
    if (m_meetings.size() != before) {
        persist();
        emit meetingsChanged();
    }
    qCInfo(lcClient) << "Meeting deleted:" << data::describe(meeting);
    emit meetingDeleted(meeting);
}

void ClientReconciler::recordCreated(const data::Meeting &meeting)
{
    m_meetings.append(meeting);
    persist();
    emit meetingsChanged();
}

void ClientReconciler::recordUpdated(const data::Meeting &meeting)
{
    bool replaced = false;
    for (data::Meeting &cached : m_meetings) {
        if (data::sameOrganizerAndTopic(cached, meeting)) {
            cached = meeting;
            replaced = true;
        }
    }
    if (!replaced) {
        m_meetings.append(meeting);
    }
    dropPending(meeting);
    persist();
    emit meetingsChanged();
}

void ClientReconciler::recordDeleted(const data::Meeting &meeting)
{
    const auto it = std::find_if(m_meetings.begin(), m_meetings.end(), [&meeting](const data::Meeting &cached) {
        return data::sameOrganizerAndTopic(cached, meeting);
    });
    if (it == m_meetings.end()) {
        return;
    }
    m_meetings.erase(it);
    persist();
    emit meetingsChanged();
}

void ClientReconciler::dropPending(const data::Meeting &meeting)
{
    m_pendingConflicts.erase(std::remove_if(m_pendingConflicts.begin(), m_pendingConflicts.end(),
                                            [&meeting](const data::Meeting &pending) {
                                                return data::sameOrganizerAndTopic(pending, meeting);
                                            }),
                             m_pendingConflicts.end());
}

void ClientReconciler::persist()
{
    if (m_storage && !m_storage->replaceAll(m_meetings)) {
        qCWarning(lcClient) << "Local meeting cache not written";
    }
}

} // namespace client
} // namespace meetings
