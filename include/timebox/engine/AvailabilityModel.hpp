#pragma once

#include <QDateTime>
#include <QTimeZone>
#include <vector>

#include "timebox/data/AvailabilityRule.hpp"
#include "timebox/data/WorkItem.hpp"
#include "timebox/engine/SchedulingOptions.hpp"
#include "timebox/engine/TimeSlot.hpp"

namespace timebox {
namespace engine {

/**
 * Materializes the weekly rules into dated slots for @p horizonDays days starting
 * with the day containing @p now in @p timeZone. Slots ending at or before @p now
 * are dropped, a slot straddling @p now starts at the next quarter hour. The
 * result is ordered by start; rules sharing a start keep their input order.
 */
std::vector<TimeSlot> generateSlots(const std::vector<data::AvailabilityRule> &rules,
                                    int horizonDays,
                                    const QDateTime &now,
                                    const QTimeZone &timeZone);

// Hours offered per week by all active, valid rules.
double weeklyAvailableHours(const std::vector<data::AvailabilityRule> &rules);

/**
 * Number of days to generate slots for so that the outstanding hours of all
 * non-completed items fit, with a minimum and a margin in weeks. Never exceeds
 * options.maxHorizonDays.
 */
int horizonDays(const std::vector<data::WorkItem> &items,
                const std::vector<data::AvailabilityRule> &rules,
                const SchedulingOptions &options);

QDateTime roundUpToQuarterHour(const QDateTime &instant);

} // namespace engine
} // namespace timebox
