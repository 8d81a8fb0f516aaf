#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>

namespace timebox {
namespace data {

enum class AssignmentStatus
{
    Scheduled,
    Completed,
    Conflicted,
};

struct Assignment
{
    QUuid id;
    QUuid workItemId;
    QString workItemName;
    QDateTime start;
    QDateTime end;
    double durationHours = 0.0;
    AssignmentStatus status = AssignmentStatus::Scheduled;
    int priority = 0;
    QString color;
    QString remoteEventId; // handle issued by the calendar sync, empty until synced
};

} // namespace data
} // namespace timebox
