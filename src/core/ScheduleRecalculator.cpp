#include "timebox/core/ScheduleRecalculator.hpp"

#include <QHash>
#include <QObject>
#include <QSet>
#include <QStringList>
#include <algorithm>

#include "timebox/core/Logging.hpp"
#include "timebox/data/AssignmentRepository.hpp"
#include "timebox/data/AvailabilityRepository.hpp"
#include "timebox/data/WorkItemRepository.hpp"
#include "timebox/engine/AvailabilityModel.hpp"
#include "timebox/engine/ConflictFilter.hpp"
#include "timebox/engine/ConflictResolver.hpp"
#include "timebox/sync/BusyIntervalProvider.hpp"
#include "timebox/sync/CalendarSync.hpp"

namespace timebox {
namespace core {

double RecalculationReport::unscheduledHours() const
{
    double total = 0.0;
    for (const auto &remainder : unscheduled) {
        total += remainder.hours;
    }
    return total;
}

QString RecalculationReport::summary() const
{
    if (!ok) {
        return QObject::tr("Schedule update failed: %1").arg(error);
    }
    QStringList parts;
    parts << QObject::tr("%1 sessions created").arg(assignmentsCreated);
    parts << QObject::tr("%1 calendar conflicts avoided").arg(busyIntervals);
    if (rescheduled > 0 || conflicted > 0) {
        parts << QObject::tr("%1 conflicted, %2 rescheduled").arg(conflicted).arg(rescheduled);
    }
    if (unplaced > 0) {
        parts << QObject::tr("%1 left conflicted").arg(unplaced);
    }
    if (remoteCreated + remoteCreateFailed > 0) {
        parts << QObject::tr("%1 calendar events created, %2 failed").arg(remoteCreated).arg(remoteCreateFailed);
    }
    if (remoteDeleted + remoteDeleteFailed > 0) {
        parts << QObject::tr("%1 calendar events deleted, %2 failed").arg(remoteDeleted).arg(remoteDeleteFailed);
    }
    if (!unscheduled.empty()) {
        parts << QObject::tr("%1h could not be scheduled").arg(unscheduledHours(), 0, 'f', 2);
    }
    if (busyFetchFailed) {
        parts << QObject::tr("external calendar unavailable");
    }
    return parts.join(QStringLiteral(", "));
}

ScheduleRecalculator::ScheduleRecalculator(data::WorkItemRepository &workItems,
                                           data::AvailabilityRepository &rules,
                                           data::AssignmentRepository &assignments,
                                           sync::BusyIntervalProvider *busyProvider,
                                           sync::CalendarSync *calendarSync,
                                           engine::SchedulingOptions options)
    : m_workItems(workItems)
    , m_rules(rules)
    , m_assignments(assignments)
    , m_busyProvider(busyProvider)
    , m_calendarSync(calendarSync)
    , m_options(std::move(options))
    , m_clock([]() { return QDateTime::currentDateTime(); })
{
}

ScheduleRecalculator::~ScheduleRecalculator() = default;

void ScheduleRecalculator::setClock(std::function<QDateTime()> clock)
{
    m_clock = std::move(clock);
}

const engine::SchedulingOptions &ScheduleRecalculator::options() const
{
    return m_options;
}

RecalculationReport ScheduleRecalculator::recalculate()
{
    RecalculationReport report;
    const QDateTime now = m_clock();
    const auto items = m_workItems.fetchWorkItems();
    const auto rules = m_rules.fetchRules();
    const int days = engine::horizonDays(items, rules, m_options);
    qCInfo(lcCore) << "Recalculating" << items.size() << "work items against" << rules.size() << "rules over" << days
                   << "days";

    const auto busy = fetchBusy(now, now.addDays(days), report);
    report.busyIntervals = static_cast<int>(busy.size());

    const auto previous = m_assignments.fetchAssignments();
    for (const auto &assignment : previous) {
        if (assignment.status != data::AssignmentStatus::Completed && !assignment.remoteEventId.isEmpty()) {
            deleteRemote(assignment.remoteEventId, report);
        }
    }

    if (!m_assignments.clearOpenAssignments()) {
        report.ok = false;
        report.error = QObject::tr("could not clear the previous schedule");
        qCCritical(lcCore).noquote() << report.error;
        return report;
    }

    QSet<QUuid> completedIds;
    auto slots = engine::generateSlots(rules, days, now, m_options.timeZone);
    for (const auto &assignment : previous) {
        if (assignment.status == data::AssignmentStatus::Completed) {
            completedIds.insert(assignment.id);
            engine::blockWindow(slots, assignment.start, assignment.end);
        }
    }
    report.slotsBlocked = engine::blockConflicting(slots, busy);
    auto result = engine::schedule(items, slots, busy);
    report.slotsBlocked += result.commitConflicts;
    report.unscheduled = result.unscheduled;

    // Pass-local ids repeat across passes and must not overwrite a completed session.
    for (auto &assignment : result.assignments) {
        while (completedIds.contains(assignment.id)) {
            assignment.id = QUuid::createUuid();
        }
    }

    if (!m_assignments.addAssignments(result.assignments)) {
        report.ok = false;
        report.error = QObject::tr("could not save %1 new sessions").arg(static_cast<int>(result.assignments.size()));
        qCCritical(lcCore).noquote() << report.error;
        return report;
    }
    report.assignmentsCreated = static_cast<int>(result.assignments.size());
    qCInfo(lcCore) << "Saved" << report.assignmentsCreated << "sessions," << report.busyIntervals
                   << "external events considered";

    updateItemStatuses(result.assignments);
    publish(result.assignments, report);
    return report;
}

RecalculationReport ScheduleRecalculator::reconcile()
{
    RecalculationReport report;
    const QDateTime now = m_clock();
    const auto current = m_assignments.fetchAssignments();

    QDateTime horizonEnd = now.addDays(m_options.rescheduleHorizonDays);
    for (const auto &assignment : current) {
        horizonEnd = std::max(horizonEnd, assignment.end);
    }
    const auto busy = fetchBusy(now, horizonEnd, report);
    if (report.busyFetchFailed) {
        report.ok = false;
        report.error = QObject::tr("busy intervals could not be fetched");
        return report;
    }
    report.busyIntervals = static_cast<int>(busy.size());

    const auto resolved = engine::resolveConflicts(current, busy);
    std::vector<data::Assignment> conflicted;
    for (const auto &assignment : resolved) {
        if (assignment.status == data::AssignmentStatus::Conflicted) {
            conflicted.push_back(assignment);
        }
    }
    report.conflicted = static_cast<int>(conflicted.size());
    if (conflicted.empty()) {
        qCInfo(lcCore) << "No conflicts with" << busy.size() << "busy intervals";
        return report;
    }

    const auto result = engine::reschedule(resolved, m_workItems.fetchWorkItems(), m_rules.fetchRules(), busy, now,
                                           m_options);
    report.rescheduled = result.rescheduled;
    report.unplaced = static_cast<int>(result.unplaced.size());

    QHash<QUuid, data::Assignment> originals;
    for (const auto &assignment : conflicted) {
        originals.insert(assignment.id, assignment);
    }

    std::vector<data::Assignment> open;
    std::vector<data::Assignment> moved;
    for (const auto &assignment : result.assignments) {
        if (assignment.status == data::AssignmentStatus::Completed) {
            continue;
        }
        open.push_back(assignment);
        if (originals.contains(assignment.id)) {
            moved.push_back(assignment);
        }
    }
    // Unplaced assignments stay on record as conflicted until the next full recalculation.
    open.insert(open.end(), result.unplaced.begin(), result.unplaced.end());

    if (!m_assignments.replaceOpenAssignments(open)) {
        report.ok = false;
        report.error = QObject::tr("could not save the rescheduled sessions");
        qCCritical(lcCore).noquote() << report.error;
        return report;
    }

    for (const auto &assignment : moved) {
        const QString oldRemoteId = originals.value(assignment.id).remoteEventId;
        if (!oldRemoteId.isEmpty()) {
            deleteRemote(oldRemoteId, report);
        }
    }
    publish(moved, report);
    qCInfo(lcCore).noquote() << report.summary();
    return report;
}

bool ScheduleRecalculator::completeAssignment(const QUuid &assignmentId)
{
    auto assignment = m_assignments.findById(assignmentId);
    if (!assignment) {
        return false;
    }
    if (assignment->status == data::AssignmentStatus::Completed) {
        return true;
    }
    assignment->status = data::AssignmentStatus::Completed;
    return m_assignments.updateAssignment(*assignment);
}

bool ScheduleRecalculator::removeWorkItem(const QUuid &workItemId)
{
    if (!m_workItems.findById(workItemId)) {
        return false;
    }
    RecalculationReport ignored;
    for (const auto &assignment : m_assignments.fetchAssignments()) {
        if (assignment.workItemId == workItemId && assignment.status != data::AssignmentStatus::Completed
            && !assignment.remoteEventId.isEmpty()) {
            deleteRemote(assignment.remoteEventId, ignored);
        }
    }
    if (!m_assignments.removeOpenAssignmentsFor(workItemId)) {
        return false;
    }
    return m_workItems.removeWorkItem(workItemId);
}

std::vector<data::BusyInterval> ScheduleRecalculator::fetchBusy(const QDateTime &from, const QDateTime &to,
                                                                RecalculationReport &report) const
{
    if (!m_busyProvider) {
        return {};
    }
    auto busy = m_busyProvider->fetchBusyIntervals(from, to);
    if (!busy) {
        qCWarning(lcSync) << "Proceeding without external calendar events";
        report.busyFetchFailed = true;
        return {};
    }
    return *busy;
}

void ScheduleRecalculator::deleteRemote(const QString &remoteEventId, RecalculationReport &report)
{
    if (!m_calendarSync) {
        return;
    }
    if (m_calendarSync->deleteEvent(remoteEventId)) {
        ++report.remoteDeleted;
    } else {
        qCWarning(lcSync) << "Failed to delete calendar event" << remoteEventId;
        ++report.remoteDeleteFailed;
    }
}

void ScheduleRecalculator::publish(std::vector<data::Assignment> &created, RecalculationReport &report)
{
    if (!m_calendarSync) {
        return;
    }
    for (auto &assignment : created) {
        const auto remoteId = m_calendarSync->createEvent(assignment);
        if (!remoteId) {
            qCWarning(lcSync).noquote() << "Failed to create calendar event for" << assignment.workItemName << "at"
                                        << assignment.start.toString(Qt::ISODate);
            ++report.remoteCreateFailed;
            continue;
        }
        ++report.remoteCreated;
        assignment.remoteEventId = *remoteId;
        if (!m_assignments.updateAssignment(assignment)) {
            qCWarning(lcData) << "Could not record calendar event id for session" << assignment.id;
        }
    }
}

void ScheduleRecalculator::updateItemStatuses(const std::vector<data::Assignment> &assignments)
{
    QSet<QUuid> scheduled;
    for (const auto &assignment : assignments) {
        scheduled.insert(assignment.workItemId);
    }
    for (auto item : m_workItems.fetchWorkItems()) {
        if (item.status == data::WorkItemStatus::Completed) {
            continue;
        }
        const auto status = scheduled.contains(item.id) ? data::WorkItemStatus::Scheduled
                                                        : data::WorkItemStatus::Pending;
        if (item.status == status) {
            continue;
        }
        item.status = status;
        if (!m_workItems.updateWorkItem(item)) {
            qCWarning(lcData).noquote() << "Could not update status of" << item.name;
        }
    }
}

} // namespace core
} // namespace timebox
