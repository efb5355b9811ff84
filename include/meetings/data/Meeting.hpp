#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVector>

namespace meetings {
namespace data {

struct Employee
{
    QString id;
    QString fullName;
};

struct Meeting
{
    QString topic;
    Employee organizer;
    QVector<Employee> invitees;
    QString place;
    QDateTime start;
    QDateTime end;
};

bool operator==(const Employee &lhs, const Employee &rhs);
bool operator!=(const Employee &lhs, const Employee &rhs);
bool operator==(const Meeting &lhs, const Meeting &rhs);
bool operator!=(const Meeting &lhs, const Meeting &rhs);

// Update matching key: (organizer id, topic, place).
bool sameIdentity(const Meeting &lhs, const Meeting &rhs);
// Deletion matching key: (organizer id, topic).
bool sameOrganizerAndTopic(const Meeting &lhs, const Meeting &rhs);

bool hasParticipant(const Meeting &meeting, const QString &employeeId);
QStringList participantIds(const Meeting &meeting);

bool isValid(const Meeting &meeting, QString *reason = nullptr);

QDateTime fromEpochMilliseconds(qint64 value);
QString describe(const Meeting &meeting);

} // namespace data
} // namespace meetings
