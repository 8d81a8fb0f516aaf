#pragma once

#include <QDateTime>

namespace timebox {
namespace engine {

// Concrete candidate window for one rule occurrence. Regenerated on every pass.
struct TimeSlot
{
    QDateTime start;
    QDateTime end;
    double durationHours = 0.0;
    bool available = true;
};

} // namespace engine
} // namespace timebox
