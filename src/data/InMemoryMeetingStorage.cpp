#include "meetings/data/InMemoryMeetingStorage.hpp"

namespace meetings {
namespace data {

InMemoryMeetingStorage::InMemoryMeetingStorage() = default;

InMemoryMeetingStorage::InMemoryMeetingStorage(QVector<Meeting> meetings)
    : m_meetings(std::move(meetings))
{
}

InMemoryMeetingStorage::~InMemoryMeetingStorage() = default;

QVector<Meeting> InMemoryMeetingStorage::loadAll()
{
    return m_meetings;
}

bool InMemoryMeetingStorage::replaceAll(const QVector<Meeting> &meetings)
{
    m_meetings = meetings;
    ++m_writeCount;
    return true;
}

const QVector<Meeting> &InMemoryMeetingStorage::meetings() const
{
    return m_meetings;
}

int InMemoryMeetingStorage::writeCount() const
{
    return m_writeCount;
}

} // namespace data
} // namespace meetings
