#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>

namespace timebox {
namespace data {

enum class WorkItemStatus
{
    Pending,
    Scheduled,
    Completed,
};

struct WorkItem
{
    QUuid id = QUuid::createUuid();
    QString name;
    QString description;
    QDateTime dueDate;
    double estimatedHours = 0.0;
    int priority = 1; // 1 = highest
    WorkItemStatus status = WorkItemStatus::Pending;
};

} // namespace data
} // namespace timebox
