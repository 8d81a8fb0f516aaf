#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <optional>
#include <vector>

#include "timebox/data/Assignment.hpp"
#include "timebox/data/BusyInterval.hpp"
#include "timebox/data/WorkItem.hpp"
#include "timebox/engine/TimeSlot.hpp"

namespace timebox {
namespace engine {

// Hours of an item that found no slot in the horizon.
struct UnscheduledRemainder
{
    QUuid workItemId;
    QString workItemName;
    double hours = 0.0;
};

struct ScheduleResult
{
    std::vector<data::Assignment> assignments;
    std::vector<UnscheduledRemainder> unscheduled;
    int commitConflicts = 0; // slots rejected by the busy re-check at commit time
};

struct ScheduledSpan
{
    QDateTime start;
    QDateTime end;
};

/**
 * Greedily places the non-completed @p items into @p slots in ascending priority
 * order (ties keep input order). Each available slot goes to at most one item;
 * the item takes min(slot duration, remaining hours) from its start. Candidate
 * windows are checked against @p busy again before they are committed. Used
 * slots are marked unavailable in @p slots.
 */
ScheduleResult schedule(const std::vector<data::WorkItem> &items,
                        std::vector<TimeSlot> &slots,
                        const std::vector<data::BusyInterval> &busy);

// First start and last end of an item's non-conflicted assignments.
std::optional<ScheduledSpan> scheduledSpan(const QUuid &workItemId, const std::vector<data::Assignment> &assignments);

QString colorForWorkItem(const QUuid &workItemId);

} // namespace engine
} // namespace timebox
