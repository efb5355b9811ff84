#pragma once

#include <QString>
#include <QVector>

#include "meetings/data/Meeting.hpp"

namespace meetings {
namespace core {

enum class NotificationKind
{
    ConflictUpdate,
    ConflictResolution,
    Deletion,
};

// ConflictUpdate carries the causing meeting followed by its affected
// meetings; the other kinds carry exactly one meeting.
struct Notification
{
    QString employeeId;
    NotificationKind kind = NotificationKind::ConflictUpdate;
    QVector<data::Meeting> meetings;
};

} // namespace core
} // namespace meetings
