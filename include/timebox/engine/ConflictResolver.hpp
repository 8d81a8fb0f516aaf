#pragma once

#include <QDateTime>
#include <vector>

#include "timebox/data/Assignment.hpp"
#include "timebox/data/AvailabilityRule.hpp"
#include "timebox/data/BusyInterval.hpp"
#include "timebox/data/WorkItem.hpp"
#include "timebox/engine/SchedulingOptions.hpp"

namespace timebox {
namespace engine {

struct RescheduleResult
{
    std::vector<data::Assignment> assignments; // ordered by start
    std::vector<data::Assignment> unplaced;    // conflicted assignments that found no replacement
    int rescheduled = 0;
};

// Marks every non-completed assignment overlapping one of @p conflicts as conflicted.
std::vector<data::Assignment> resolveConflicts(std::vector<data::Assignment> assignments,
                                               const std::vector<data::BusyInterval> &conflicts);

/**
 * Moves the conflicted assignments into the earliest free slot of a fresh
 * options.rescheduleHorizonDays horizon that is at least as long as the
 * assignment. Slots occupied by the remaining assignments or by @p busy are
 * not used. Assignments that cannot be placed, or whose work item is completed
 * or unknown, are left out of the result's assignments and reported in unplaced.
 */
RescheduleResult reschedule(const std::vector<data::Assignment> &assignments,
                            const std::vector<data::WorkItem> &items,
                            const std::vector<data::AvailabilityRule> &rules,
                            const std::vector<data::BusyInterval> &busy,
                            const QDateTime &now,
                            const SchedulingOptions &options);

} // namespace engine
} // namespace timebox
