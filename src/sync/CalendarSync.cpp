#include "timebox/sync/CalendarSync.hpp"

namespace timebox {
namespace sync {

QString sessionTitle(const data::Assignment &assignment)
{
    return QStringLiteral("Work Session: %1").arg(assignment.workItemName);
}

QString sessionDescription(const data::Assignment &assignment)
{
    return QStringLiteral("Scheduled work session for %1 (%2 hours)")
        .arg(assignment.workItemName)
        .arg(assignment.durationHours);
}

} // namespace sync
} // namespace timebox
