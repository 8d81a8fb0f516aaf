#pragma once

#include <QHash>
#include <QString>
#include <QUuid>
#include <functional>
#include <vector>

#include "timebox/data/Assignment.hpp"
#include "timebox/data/AvailabilityRule.hpp"
#include "timebox/data/WorkItem.hpp"

namespace timebox {
namespace data {

/**
 * Keeps work items (VTODO), availability rules (VAVAILABILITY) and assignments
 * (VEVENT) in one iCalendar file. Every mutation rewrites the file atomically;
 * when the write fails the in-memory state is rolled back and false returned.
 */
class FileScheduleStorage
{
public:
    explicit FileScheduleStorage(QString filePath);
    ~FileScheduleStorage() = default;

    const QString &filePath() const;

    const QHash<QUuid, WorkItem> &workItems() const;
    const QHash<QUuid, AvailabilityRule> &rules() const;
    const QList<QUuid> &ruleOrder() const;
    const QHash<QUuid, Assignment> &assignments() const;

    bool storeWorkItems(const std::vector<WorkItem> &items);
    // Also drops the item's assignments that are not completed.
    bool removeWorkItem(const QUuid &id);

    bool storeRule(const AvailabilityRule &rule);
    bool removeRule(const QUuid &id);

    bool storeAssignments(const std::vector<Assignment> &assignments);
    bool replaceAssignments(const std::function<bool(const Assignment &)> &removeIf,
                            const std::vector<Assignment> &added);

private:
    void load();
    bool save() const;

    // Applies @p mutation and persists it, restoring the previous state on failure.
    bool commit(const std::function<void()> &mutation);

    static QString itemStatusToString(WorkItemStatus status);
    static WorkItemStatus itemStatusFromString(const QString &value);
    static QString assignmentStatusToString(AssignmentStatus status);
    static AssignmentStatus assignmentStatusFromString(const QString &value);

    QString m_filePath;
    QHash<QUuid, WorkItem> m_workItems;
    QHash<QUuid, AvailabilityRule> m_rules;
    QList<QUuid> m_ruleOrder;
    QHash<QUuid, Assignment> m_assignments;
};

} // namespace data
} // namespace timebox
