#include "timebox/engine/PriorityScheduler.hpp"

#include <QHash>
#include <QStringList>
#include <algorithm>

#include "timebox/core/Logging.hpp"
#include "timebox/engine/ConflictFilter.hpp"

namespace timebox {
namespace engine {

namespace {
constexpr double HoursEpsilon = 1e-9;

QUuid assignmentId(const QUuid &workItemId, std::size_t sequence)
{
    return QUuid::createUuidV5(workItemId, QString::number(static_cast<qulonglong>(sequence)));
}
} // namespace

ScheduleResult schedule(const std::vector<data::WorkItem> &items,
                        std::vector<TimeSlot> &slots,
                        const std::vector<data::BusyInterval> &busy)
{
    std::vector<const data::WorkItem *> queue;
    queue.reserve(items.size());
    for (const auto &item : items) {
        if (item.status != data::WorkItemStatus::Completed) {
            queue.push_back(&item);
        }
    }
    std::stable_sort(queue.begin(), queue.end(), [](const data::WorkItem *lhs, const data::WorkItem *rhs) {
        return lhs->priority < rhs->priority;
    });

    ScheduleResult result;
    for (const auto *item : queue) {
        double remaining = std::max(0.0, item->estimatedHours);
        if (item->estimatedHours < 0.0) {
            qCWarning(lcEngine).noquote() << "Negative hours for" << item->name << "treated as 0";
        }

        for (auto &slot : slots) {
            if (remaining <= HoursEpsilon) {
                break;
            }
            if (!slot.available) {
                continue;
            }

            const double take = std::min(slot.durationHours, remaining);
            const QDateTime start = slot.start;
            const QDateTime end = start.addMSecs(qRound64(take * 3600000.0));
            if (overlapsAny(start, end, busy)) {
                qCDebug(lcEngine) << "Commit-time conflict for" << item->name << "at" << start;
                slot.available = false;
                ++result.commitConflicts;
                continue;
            }

            data::Assignment assignment;
            assignment.id = assignmentId(item->id, result.assignments.size());
            assignment.workItemId = item->id;
            assignment.workItemName = item->name;
            assignment.start = start;
            assignment.end = end;
            assignment.durationHours = take;
            assignment.status = data::AssignmentStatus::Scheduled;
            assignment.priority = item->priority;
            assignment.color = colorForWorkItem(item->id);
            result.assignments.push_back(assignment);

            remaining -= take;
            slot.available = false;
        }

        if (remaining > HoursEpsilon) {
            result.unscheduled.push_back({ item->id, item->name, remaining });
            qCInfo(lcEngine).noquote() << QStringLiteral("%1h of \"%2\" did not fit the horizon")
                                              .arg(remaining, 0, 'f', 2)
                                              .arg(item->name);
        }
    }
    return result;
}

std::optional<ScheduledSpan> scheduledSpan(const QUuid &workItemId, const std::vector<data::Assignment> &assignments)
{
    std::optional<ScheduledSpan> span;
    for (const auto &assignment : assignments) {
        if (assignment.workItemId != workItemId || assignment.status == data::AssignmentStatus::Conflicted) {
            continue;
        }
        if (!span) {
            span = ScheduledSpan{ assignment.start, assignment.end };
            continue;
        }
        span->start = std::min(span->start, assignment.start);
        span->end = std::max(span->end, assignment.end);
    }
    return span;
}

QString colorForWorkItem(const QUuid &workItemId)
{
    static const QStringList palette = {
        QStringLiteral("#3B82F6"), QStringLiteral("#10B981"), QStringLiteral("#8B5CF6"), QStringLiteral("#F59E0B"),
        QStringLiteral("#EF4444"), QStringLiteral("#06B6D4"), QStringLiteral("#84CC16"), QStringLiteral("#F97316"),
    };
    return palette.at(static_cast<int>(qHash(workItemId) % static_cast<uint>(palette.size())));
}

} // namespace engine
} // namespace timebox
