#pragma once

#include <memory>

#include "timebox/core/Settings.hpp"

namespace timebox {
namespace data {
class DataProvider;
class WorkItemRepository;
class AvailabilityRepository;
class AssignmentRepository;
}

namespace sync {
class BusyIntervalProvider;
class CalendarSync;
}

namespace core {

class ScheduleRecalculator;

class AppContext
{
public:
    explicit AppContext(Settings settings);
    ~AppContext();

    const Settings &settings() const;
    data::WorkItemRepository &workItemRepository();
    data::AvailabilityRepository &availabilityRepository();
    data::AssignmentRepository &assignmentRepository();
    ScheduleRecalculator &recalculator();

private:
    Settings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<sync::BusyIntervalProvider> m_busyProvider;
    std::unique_ptr<sync::CalendarSync> m_calendarSync;
    std::unique_ptr<ScheduleRecalculator> m_recalculator;
};

} // namespace core
} // namespace timebox
