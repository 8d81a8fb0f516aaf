#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "timebox/core/AppContext.hpp"
#include "timebox/core/ScheduleRecalculator.hpp"
#include "timebox/data/AssignmentRepository.hpp"
#include "timebox/data/AvailabilityRepository.hpp"
#include "timebox/data/WorkItemRepository.hpp"

using namespace timebox;

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void recalculatesIntoFiles();
};

void AppContextTest::recalculatesIntoFiles()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    core::Settings settings;
    settings.scheduling.timeZone = QTimeZone::utc();
    settings.storagePath = dir.filePath("schedule.ics");
    settings.exportCalendarPath = dir.filePath("sessions.ics");

    int created = 0;
    {
        core::AppContext context(settings);

        data::AvailabilityRule allDay;
        allDay.name = "All day";
        allDay.weekdays = { 0, 1, 2, 3, 4, 5, 6 };
        allDay.startTime = QTime(0, 0);
        allDay.endTime = QTime(23, 59, 59, 999);
        context.availabilityRepository().addRule(allDay);

        data::WorkItem item;
        item.name = "Report";
        item.estimatedHours = 30.0;
        context.workItemRepository().addWorkItem(item);

        const auto report = context.recalculator().recalculate();
        QVERIFY(report.ok);
        QVERIFY(report.assignmentsCreated >= 2);
        QCOMPARE(report.remoteCreated, report.assignmentsCreated);
        QVERIFY(report.unscheduled.empty());
        created = report.assignmentsCreated;
    }

    QVERIFY(QFile::exists(settings.exportCalendarPath));

    core::AppContext reloaded(settings);
    const auto assignments = reloaded.assignmentRepository().fetchAssignments();
    QCOMPARE(static_cast<int>(assignments.size()), created);
    double hours = 0.0;
    for (const auto &assignment : assignments) {
        QVERIFY(!assignment.remoteEventId.isEmpty());
        hours += assignment.durationHours;
    }
    QVERIFY(qAbs(hours - 30.0) < 1e-6);
    QVERIFY(reloaded.workItemRepository().fetchWorkItems().front().status == data::WorkItemStatus::Scheduled);
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
