#pragma once

#include "meetings/data/MeetingStorage.hpp"

namespace meetings {
namespace data {

class InMemoryMeetingStorage : public MeetingStorage
{
public:
    InMemoryMeetingStorage();
    explicit InMemoryMeetingStorage(QVector<Meeting> meetings);
    ~InMemoryMeetingStorage() override;

    QVector<Meeting> loadAll() override;
    bool replaceAll(const QVector<Meeting> &meetings) override;

    const QVector<Meeting> &meetings() const;
    int writeCount() const;

private:
    QVector<Meeting> m_meetings;
    int m_writeCount = 0;
};

} // namespace data
} // namespace meetings
