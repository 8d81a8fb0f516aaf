#include "timebox/engine/AvailabilityModel.hpp"

#include <algorithm>
#include <cmath>

#include "timebox/core/Logging.hpp"

namespace timebox {
namespace engine {

namespace {
constexpr qint64 QuarterHourMSecs = 15 * 60 * 1000;

std::vector<const data::AvailabilityRule *> usableRules(const std::vector<data::AvailabilityRule> &rules)
{
    std::vector<const data::AvailabilityRule *> usable;
    usable.reserve(rules.size());
    for (const auto &rule : rules) {
        if (!rule.active) {
            continue;
        }
        const QString problem = data::validateRule(rule);
        if (!problem.isEmpty()) {
            qCWarning(lcEngine).noquote() << "Ignoring availability rule:" << problem;
            continue;
        }
        usable.push_back(&rule);
    }
    return usable;
}
} // namespace

std::vector<TimeSlot> generateSlots(const std::vector<data::AvailabilityRule> &rules,
                                    int horizonDays,
                                    const QDateTime &now,
                                    const QTimeZone &timeZone)
{
    std::vector<TimeSlot> slots;
    if (horizonDays <= 0 || !now.isValid()) {
        return slots;
    }

    const auto usable = usableRules(rules);
    if (usable.empty()) {
        return slots;
    }

    const QDate today = now.toTimeZone(timeZone).date();
    for (int offset = 0; offset < horizonDays; ++offset) {
        const QDate day = today.addDays(offset);
        const int weekday = data::weekdayOf(day);
        for (const auto *rule : usable) {
            if (!rule->weekdays.contains(weekday)) {
                continue;
            }
            QDateTime start(day, rule->startTime, timeZone);
            const QDateTime end = rule->endsAtMidnight() ? QDateTime(day.addDays(1), QTime(0, 0), timeZone)
                                                         : QDateTime(day, rule->endTime, timeZone);
            if (end <= now) {
                continue;
            }
            if (start < now) {
                start = roundUpToQuarterHour(now);
            }
            if (start >= end) {
                continue;
            }
            if (rule->minimumDurationMinutes > 0
                && start.secsTo(end) < static_cast<qint64>(rule->minimumDurationMinutes) * 60) {
                continue;
            }

            TimeSlot slot;
            slot.start = start;
            slot.end = end;
            slot.durationHours = start.msecsTo(end) / 3600000.0;
            slots.push_back(slot);
        }
    }

    std::stable_sort(slots.begin(), slots.end(), [](const TimeSlot &lhs, const TimeSlot &rhs) {
        return lhs.start < rhs.start;
    });
    qCDebug(lcEngine) << "Generated" << slots.size() << "slots over" << horizonDays << "days";
    return slots;
}

double weeklyAvailableHours(const std::vector<data::AvailabilityRule> &rules)
{
    double total = 0.0;
    for (const auto *rule : usableRules(rules)) {
        total += rule->occurrenceHours() * rule->weekdays.size();
    }
    return total;
}

int horizonDays(const std::vector<data::WorkItem> &items,
                const std::vector<data::AvailabilityRule> &rules,
                const SchedulingOptions &options)
{
    double outstanding = 0.0;
    for (const auto &item : items) {
        if (item.status == data::WorkItemStatus::Completed) {
            continue;
        }
        outstanding += std::max(0.0, item.estimatedHours);
    }

    double weekly = weeklyAvailableHours(rules);
    if (weekly <= 0.0) {
        weekly = 1.0;
    }

    const double weeksNeeded = std::ceil(outstanding / weekly) + options.horizonMarginWeeks;
    const double weeks = std::max<double>(options.minimumHorizonWeeks, weeksNeeded);
    const double days = std::min<double>(weeks * 7.0, options.maxHorizonDays);
    return std::max(0, static_cast<int>(days));
}

QDateTime roundUpToQuarterHour(const QDateTime &instant)
{
    const qint64 msecs = instant.toMSecsSinceEpoch();
    qint64 remainder = msecs % QuarterHourMSecs;
    if (remainder < 0) {
        remainder += QuarterHourMSecs;
    }
    if (remainder == 0) {
        return instant;
    }
    return instant.addMSecs(QuarterHourMSecs - remainder);
}

} // namespace engine
} // namespace timebox
