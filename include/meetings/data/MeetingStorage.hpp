#pragma once

#include <QVector>

#include "meetings/data/Meeting.hpp"

namespace meetings {
namespace data {

class MeetingStorage
{
public:
    virtual ~MeetingStorage() = default;

    virtual QVector<Meeting> loadAll() = 0;
    // Replaces the whole persisted state. Returns false when nothing was written.
    virtual bool replaceAll(const QVector<Meeting> &meetings) = 0;
};

} // namespace data
} // namespace meetings
