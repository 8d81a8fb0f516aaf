#pragma once

#include <QDate>
#include <QObject>
#include <QTimer>
#include <vector>

#include "timebox/core/ScheduleRecalculator.hpp"
#include "timebox/data/Assignment.hpp"

namespace timebox {
namespace data {
class AssignmentRepository;
}

namespace ui {

/**
 * Sessions of a date range plus the recalculation trigger. Requests arriving
 * within the debounce interval collapse into one full recalculation, so two
 * rebuilds never race on the stored schedule.
 */
class ScheduleViewModel : public QObject
{
    Q_OBJECT

public:
    ScheduleViewModel(data::AssignmentRepository &repository,
                      core::ScheduleRecalculator &recalculator,
                      QObject *parent = nullptr);

    void setRange(const QDate &start, const QDate &end);
    void setDebounceInterval(int msecs);
    void refresh();

    const std::vector<data::Assignment> &assignments() const;
    const core::RecalculationReport &lastReport() const;
    bool isRecalculationPending() const;

public slots:
    // Item or rule edits.
    void requestRecalculation();
    // External calendar changed; treated like any other edit.
    void calendarChanged();
    void recalculateNow();
    void reconcileNow();

signals:
    void assignmentsChanged();
    void recalculated();

private:
    data::AssignmentRepository &m_repository;
    core::ScheduleRecalculator &m_recalculator;
    QTimer m_debounce;
    QDate m_start;
    QDate m_end;
    std::vector<data::Assignment> m_assignments;
    core::RecalculationReport m_lastReport;
};

} // namespace ui
} // namespace timebox
