#include "timebox/core/AppContext.hpp"

#include "timebox/core/ScheduleRecalculator.hpp"
#include "timebox/data/DataProvider.hpp"
#include "timebox/sync/IcsBusyIntervalProvider.hpp"
#include "timebox/sync/IcsCalendarSync.hpp"

namespace timebox {
namespace core {

AppContext::AppContext(Settings settings)
    : m_settings(std::move(settings))
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings.storagePath))
    , m_busyProvider(std::make_unique<sync::IcsBusyIntervalProvider>(m_settings.busyCalendarPath))
{
    if (!m_settings.exportCalendarPath.isEmpty()) {
        m_calendarSync = std::make_unique<sync::IcsCalendarSync>(m_settings.exportCalendarPath);
    }
    m_recalculator = std::make_unique<ScheduleRecalculator>(m_dataProvider->workItemRepository(),
                                                            m_dataProvider->availabilityRepository(),
                                                            m_dataProvider->assignmentRepository(),
                                                            m_busyProvider.get(),
                                                            m_calendarSync.get(),
                                                            m_settings.scheduling);
}

AppContext::~AppContext() = default;

const Settings &AppContext::settings() const
{
    return m_settings;
}

data::WorkItemRepository &AppContext::workItemRepository()
{
    return m_dataProvider->workItemRepository();
}

data::AvailabilityRepository &AppContext::availabilityRepository()
{
    return m_dataProvider->availabilityRepository();
}

data::AssignmentRepository &AppContext::assignmentRepository()
{
    return m_dataProvider->assignmentRepository();
}

ScheduleRecalculator &AppContext::recalculator()
{
    return *m_recalculator;
}

} // namespace core
} // namespace timebox
