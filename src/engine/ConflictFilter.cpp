#include "timebox/engine/ConflictFilter.hpp"

#include "timebox/core/Logging.hpp"

namespace timebox {
namespace engine {

bool overlaps(const QDateTime &start1, const QDateTime &end1, const QDateTime &start2, const QDateTime &end2)
{
    return start1 < end2 && start2 < end1;
}

bool overlapsAny(const QDateTime &start, const QDateTime &end, const std::vector<data::BusyInterval> &busy)
{
    for (const auto &interval : busy) {
        if (!interval.isComplete()) {
            continue;
        }
        if (overlaps(start, end, interval.start, interval.end)) {
            return true;
        }
    }
    return false;
}

int blockConflicting(std::vector<TimeSlot> &slots, const std::vector<data::BusyInterval> &busy)
{
    if (busy.empty()) {
        return 0;
    }

    int blocked = 0;
    for (const auto &interval : busy) {
        if (!interval.isComplete()) {
            qCDebug(lcEngine) << "Skipping busy interval without both endpoints";
            continue;
        }
        blocked += blockWindow(slots, interval.start, interval.end);
    }
    return blocked;
}

int blockWindow(std::vector<TimeSlot> &slots, const QDateTime &start, const QDateTime &end)
{
    int blocked = 0;
    for (auto &slot : slots) {
        if (!slot.available) {
            continue;
        }
        if (overlaps(slot.start, slot.end, start, end)) {
            qCDebug(lcEngine) << "Blocking slot" << slot.start << "-" << slot.end;
            slot.available = false;
            ++blocked;
        }
    }
    return blocked;
}

} // namespace engine
} // namespace timebox
