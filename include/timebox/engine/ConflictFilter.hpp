#pragma once

#include <QDateTime>
#include <vector>

#include "timebox/data/BusyInterval.hpp"
#include "timebox/engine/TimeSlot.hpp"

namespace timebox {
namespace engine {

// Half-open overlap: ranges that only touch do not overlap.
bool overlaps(const QDateTime &start1, const QDateTime &end1, const QDateTime &start2, const QDateTime &end2);

// Busy intervals lacking an endpoint never conflict.
bool overlapsAny(const QDateTime &start, const QDateTime &end, const std::vector<data::BusyInterval> &busy);

/**
 * Clears the availability of every still-available slot that overlaps one of
 * @p busy. Slots are never made available again. Returns how many slots were
 * newly blocked.
 */
int blockConflicting(std::vector<TimeSlot> &slots, const std::vector<data::BusyInterval> &busy);

// Blocks the available slots overlapping [start, end).
int blockWindow(std::vector<TimeSlot> &slots, const QDateTime &start, const QDateTime &end);

} // namespace engine
} // namespace timebox
