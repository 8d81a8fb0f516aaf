#pragma once

#include <QTimeZone>

namespace timebox {
namespace engine {

struct SchedulingOptions
{
    QTimeZone timeZone = QTimeZone::systemTimeZone();
    int maxHorizonDays = 365;
    int rescheduleHorizonDays = 30;
    int minimumHorizonWeeks = 8;
    int horizonMarginWeeks = 2;
};

} // namespace engine
} // namespace timebox
