#include "timebox/engine/ConflictResolver.hpp"

#include <QHash>
#include <QUuid>
#include <algorithm>

#include "timebox/core/Logging.hpp"
#include "timebox/engine/AvailabilityModel.hpp"
#include "timebox/engine/ConflictFilter.hpp"

namespace timebox {
namespace engine {

namespace {
constexpr double HoursEpsilon = 1e-9;

void sortByStart(std::vector<data::Assignment> &assignments)
{
    std::stable_sort(assignments.begin(), assignments.end(), [](const data::Assignment &lhs, const data::Assignment &rhs) {
        return lhs.start < rhs.start;
    });
}
} // namespace

std::vector<data::Assignment> resolveConflicts(std::vector<data::Assignment> assignments,
                                               const std::vector<data::BusyInterval> &conflicts)
{
    for (auto &assignment : assignments) {
        if (assignment.status == data::AssignmentStatus::Completed) {
            continue;
        }
        if (overlapsAny(assignment.start, assignment.end, conflicts)) {
            qCInfo(lcEngine).noquote() << "Assignment for" << assignment.workItemName << "at"
                                       << assignment.start.toString(Qt::ISODate) << "is conflicted";
            assignment.status = data::AssignmentStatus::Conflicted;
        }
    }
    return assignments;
}

RescheduleResult reschedule(const std::vector<data::Assignment> &assignments,
                            const std::vector<data::WorkItem> &items,
                            const std::vector<data::AvailabilityRule> &rules,
                            const std::vector<data::BusyInterval> &busy,
                            const QDateTime &now,
                            const SchedulingOptions &options)
{
    RescheduleResult result;

    std::vector<const data::Assignment *> conflicted;
    for (const auto &assignment : assignments) {
        if (assignment.status == data::AssignmentStatus::Conflicted) {
            conflicted.push_back(&assignment);
        } else {
            result.assignments.push_back(assignment);
        }
    }
    if (conflicted.empty()) {
        sortByStart(result.assignments);
        return result;
    }

    QHash<QUuid, const data::WorkItem *> itemsById;
    for (const auto &item : items) {
        itemsById.insert(item.id, &item);
    }

    auto slots = generateSlots(rules, options.rescheduleHorizonDays, now, options.timeZone);
    for (const auto &kept : result.assignments) {
        blockWindow(slots, kept.start, kept.end);
    }
    blockConflicting(slots, busy);

    for (const auto *original : conflicted) {
        const auto *item = itemsById.value(original->workItemId, nullptr);
        if (!item || item->status == data::WorkItemStatus::Completed) {
            qCInfo(lcEngine).noquote() << "Not rescheduling" << original->workItemName << "(work item closed)";
            result.unplaced.push_back(*original);
            continue;
        }

        auto slot = std::find_if(slots.begin(), slots.end(), [&](const TimeSlot &candidate) {
            return candidate.available && candidate.durationHours + HoursEpsilon >= original->durationHours;
        });
        if (slot == slots.end()) {
            qCWarning(lcEngine).noquote() << "No free slot for conflicted assignment of" << original->workItemName;
            result.unplaced.push_back(*original);
            continue;
        }

        data::Assignment replacement = *original;
        replacement.start = slot->start;
        replacement.end = slot->start.addMSecs(qRound64(original->durationHours * 3600000.0));
        replacement.status = data::AssignmentStatus::Scheduled;
        replacement.remoteEventId.clear();
        slot->available = false;
        result.assignments.push_back(replacement);
        ++result.rescheduled;
    }

    sortByStart(result.assignments);
    return result;
}

} // namespace engine
} // namespace timebox
