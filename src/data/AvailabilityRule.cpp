#include "timebox/data/AvailabilityRule.hpp"

#include <QDate>
#include <QObject>
#include <QRegularExpression>

namespace timebox {
namespace data {

double AvailabilityRule::occurrenceHours() const
{
    if (!startTime.isValid() || !endTime.isValid()) {
        return 0.0;
    }
    if (endsAtMidnight()) {
        return (24 * 3600000 - startTime.msecsSinceStartOfDay()) / 3600000.0;
    }
    return startTime.msecsTo(endTime) / 3600000.0;
}

bool AvailabilityRule::endsAtMidnight() const
{
    return endTime == QTime(23, 59, 59, 999);
}

std::optional<QTime> parseClockTime(const QString &value)
{
    static const QRegularExpression pattern(QStringLiteral("^(\\d{1,2}):(\\d{2})$"));
    const auto match = pattern.match(value.trimmed());
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const int hours = match.captured(1).toInt();
    const int minutes = match.captured(2).toInt();
    // 24:00 closes a window at midnight.
    if (hours == 24 && minutes == 0) {
        return QTime(23, 59, 59, 999);
    }
    const QTime time(hours, minutes);
    if (!time.isValid()) {
        return std::nullopt;
    }
    return time;
}

QString formatClockTime(const QTime &time)
{
    if (time == QTime(23, 59, 59, 999)) {
        return QStringLiteral("24:00");
    }
    return time.toString(QStringLiteral("HH:mm"));
}

QString validateRule(const AvailabilityRule &rule)
{
    if (!rule.startTime.isValid() || !rule.endTime.isValid()) {
        return QObject::tr("Rule \"%1\" has an invalid start or end time").arg(rule.name);
    }
    if (rule.startTime >= rule.endTime) {
        return QObject::tr("Rule \"%1\" ends before it starts").arg(rule.name);
    }
    if (rule.weekdays.isEmpty()) {
        return QObject::tr("Rule \"%1\" has no weekdays").arg(rule.name);
    }
    for (int day : rule.weekdays) {
        if (day < 0 || day > 6) {
            return QObject::tr("Rule \"%1\" has weekday %2 outside 0-6").arg(rule.name).arg(day);
        }
    }
    if (rule.minimumDurationMinutes < 0) {
        return QObject::tr("Rule \"%1\" has a negative minimum duration").arg(rule.name);
    }
    return {};
}

int weekdayOf(const QDate &date)
{
    // QDate numbers Monday = 1 .. Sunday = 7.
    return date.dayOfWeek() % 7;
}

} // namespace data
} // namespace timebox
