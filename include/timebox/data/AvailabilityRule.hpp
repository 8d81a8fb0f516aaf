#pragma once

#include <QSet>
#include <QString>
#include <QTime>
#include <QUuid>
#include <optional>

namespace timebox {
namespace data {

// Weekdays are numbered 0 = Sunday .. 6 = Saturday.
struct AvailabilityRule
{
    QUuid id = QUuid::createUuid();
    QString name;
    QSet<int> weekdays;
    QTime startTime;
    QTime endTime;
    bool active = true;
    int minimumDurationMinutes = 0; // 0 = no minimum

    double occurrenceHours() const;
    // An end time of 24:00 closes the window at the following midnight.
    bool endsAtMidnight() const;
};

// Parses "HH:MM" (or "H:MM"); returns nullopt for anything else.
std::optional<QTime> parseClockTime(const QString &value);
QString formatClockTime(const QTime &time);

// Returns an empty string when the rule is usable, otherwise the reason it is not.
QString validateRule(const AvailabilityRule &rule);

int weekdayOf(const QDate &date);

} // namespace data
} // namespace timebox
