#pragma once

#include <QString>
#include <optional>

#include "timebox/data/Assignment.hpp"

namespace timebox {
namespace sync {

// Remote calendar that mirrors committed assignments. Calls may fail one by one.
class CalendarSync
{
public:
    virtual ~CalendarSync() = default;

    // Returns the remote event id, or nullopt on failure.
    virtual std::optional<QString> createEvent(const data::Assignment &assignment) = 0;
    virtual bool deleteEvent(const QString &remoteEventId) = 0;
};

QString sessionTitle(const data::Assignment &assignment);
QString sessionDescription(const data::Assignment &assignment);

} // namespace sync
} // namespace timebox
