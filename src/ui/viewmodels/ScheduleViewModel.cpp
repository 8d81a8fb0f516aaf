#include "timebox/ui/viewmodels/ScheduleViewModel.hpp"

#include "timebox/core/Logging.hpp"
#include "timebox/data/AssignmentRepository.hpp"

namespace timebox {
namespace ui {

ScheduleViewModel::ScheduleViewModel(data::AssignmentRepository &repository,
                                     core::ScheduleRecalculator &recalculator,
                                     QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_recalculator(recalculator)
{
    m_debounce.setSingleShot(true);
    m_debounce.setInterval(1000);
    connect(&m_debounce, &QTimer::timeout, this, &ScheduleViewModel::recalculateNow);
}

void ScheduleViewModel::setRange(const QDate &start, const QDate &end)
{
    if (!start.isValid() || !end.isValid()) {
        return;
    }
    m_start = start;
    m_end = end;
}

void ScheduleViewModel::setDebounceInterval(int msecs)
{
    m_debounce.setInterval(qMax(0, msecs));
}

void ScheduleViewModel::refresh()
{
    if (!m_start.isValid() || !m_end.isValid()) {
        m_assignments = m_repository.fetchAssignments();
    } else {
        m_assignments = m_repository.fetchAssignments(m_start, m_end);
    }
    emit assignmentsChanged();
}

const std::vector<data::Assignment> &ScheduleViewModel::assignments() const
{
    return m_assignments;
}

const core::RecalculationReport &ScheduleViewModel::lastReport() const
{
    return m_lastReport;
}

bool ScheduleViewModel::isRecalculationPending() const
{
    return m_debounce.isActive();
}

void ScheduleViewModel::requestRecalculation()
{
    m_debounce.start();
}

void ScheduleViewModel::calendarChanged()
{
    qCInfo(lcCore) << "External calendar changed";
    requestRecalculation();
}

void ScheduleViewModel::recalculateNow()
{
    m_debounce.stop();
    m_lastReport = m_recalculator.recalculate();
    qCInfo(lcCore).noquote() << m_lastReport.summary();
    refresh();
    emit recalculated();
}

void ScheduleViewModel::reconcileNow()
{
    m_lastReport = m_recalculator.reconcile();
    refresh();
    emit recalculated();
}

} // namespace ui
} // namespace timebox
