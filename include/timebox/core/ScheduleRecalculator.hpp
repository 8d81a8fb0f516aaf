#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <functional>
#include <vector>

#include "timebox/data/BusyInterval.hpp"
#include "timebox/engine/PriorityScheduler.hpp"
#include "timebox/engine/SchedulingOptions.hpp"

namespace timebox {
namespace data {
class AssignmentRepository;
class AvailabilityRepository;
class WorkItemRepository;
}

namespace sync {
class BusyIntervalProvider;
class CalendarSync;
}

namespace core {

// Outcome of one recalculation or reconcile run. ok is false only for fatal failures.
struct RecalculationReport
{
    bool ok = true;
    QString error;

    int assignmentsCreated = 0;
    int busyIntervals = 0; // external conflicts taken into account
    int slotsBlocked = 0;
    bool busyFetchFailed = false;

    int remoteDeleted = 0;
    int remoteDeleteFailed = 0;
    int remoteCreated = 0;
    int remoteCreateFailed = 0;

    int conflicted = 0;
    int rescheduled = 0;
    int unplaced = 0;

    std::vector<engine::UnscheduledRemainder> unscheduled;

    double unscheduledHours() const;
    QString summary() const;
};

/**
 * Drives the engine against the repositories and the calendar collaborators.
 *
 * recalculate() is the full rebuild used for every item, rule or calendar
 * change: it drops all open assignments and schedules from scratch.
 * reconcile() only moves the assignments that newly supplied busy time
 * invalidated and leaves the rest in place.
 */
class ScheduleRecalculator
{
public:
    ScheduleRecalculator(data::WorkItemRepository &workItems,
                         data::AvailabilityRepository &rules,
                         data::AssignmentRepository &assignments,
                         sync::BusyIntervalProvider *busyProvider,
                         sync::CalendarSync *calendarSync,
                         engine::SchedulingOptions options);
    ~ScheduleRecalculator();

    void setClock(std::function<QDateTime()> clock);
    const engine::SchedulingOptions &options() const;

    RecalculationReport recalculate();
    RecalculationReport reconcile();

    bool completeAssignment(const QUuid &assignmentId);
    // Removes the item together with its open assignments and their remote events.
    bool removeWorkItem(const QUuid &workItemId);

private:
    std::vector<data::BusyInterval> fetchBusy(const QDateTime &from, const QDateTime &to,
                                              RecalculationReport &report) const;
    void deleteRemote(const QString &remoteEventId, RecalculationReport &report);
    void publish(std::vector<data::Assignment> &created, RecalculationReport &report);
    void updateItemStatuses(const std::vector<data::Assignment> &assignments);

    data::WorkItemRepository &m_workItems;
    data::AvailabilityRepository &m_rules;
    data::AssignmentRepository &m_assignments;
    sync::BusyIntervalProvider *m_busyProvider = nullptr;
    sync::CalendarSync *m_calendarSync = nullptr;
    engine::SchedulingOptions m_options;
    std::function<QDateTime()> m_clock;
};

} // namespace core
} // namespace timebox
