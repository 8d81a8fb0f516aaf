#include <QtTest/QtTest>

#include "timebox/data/InMemoryAssignmentRepository.hpp"
#include "timebox/data/InMemoryAvailabilityRepository.hpp"
#include "timebox/data/InMemoryWorkItemRepository.hpp"
#include "timebox/ui/viewmodels/ScheduleViewModel.hpp"

using namespace timebox;

namespace {
struct Fixture
{
    data::InMemoryWorkItemRepository items;
    data::InMemoryAvailabilityRepository rules;
    data::InMemoryAssignmentRepository assignments;
    std::unique_ptr<core::ScheduleRecalculator> recalculator;

    Fixture()
    {
        data::AvailabilityRule mornings;
        mornings.name = QStringLiteral("Mornings");
        mornings.weekdays = { 1, 2, 3, 4, 5 };
        mornings.startTime = QTime(9, 0);
        mornings.endTime = QTime(10, 0);
        rules.addRule(mornings);

        data::WorkItem item;
        item.name = QStringLiteral("Report");
        item.estimatedHours = 3.0;
        items.addWorkItem(item);

        engine::SchedulingOptions options;
        options.timeZone = QTimeZone::utc();
        recalculator = std::make_unique<core::ScheduleRecalculator>(items, rules, assignments, nullptr, nullptr,
                                                                    options);
        recalculator->setClock([]() { return QDateTime(QDate(2024, 1, 1), QTime(8, 0), Qt::UTC); });
    }
};
} // namespace

class ScheduleViewModelTest : public QObject
{
    Q_OBJECT

private slots:
    void loadsRange();
    void collapsesBurstIntoOneRecalculation();
    void calendarChangeTriggersRecalculation();
};

void ScheduleViewModelTest::loadsRange()
{
    Fixture fixture;
    QVERIFY(fixture.recalculator->recalculate().ok);

    ui::ScheduleViewModel model(fixture.assignments, *fixture.recalculator);
    model.setRange(QDate(2024, 1, 2), QDate(2024, 1, 2));
    model.refresh();
    QCOMPARE(model.assignments().size(), static_cast<size_t>(1));
    QCOMPARE(model.assignments().front().workItemName, QStringLiteral("Report"));

    model.setRange(QDate(2024, 1, 1), QDate(2024, 1, 7));
    model.refresh();
    QCOMPARE(model.assignments().size(), static_cast<size_t>(3));
}

void ScheduleViewModelTest::collapsesBurstIntoOneRecalculation()
{
    Fixture fixture;
    ui::ScheduleViewModel model(fixture.assignments, *fixture.recalculator);
    model.setDebounceInterval(50);
    QSignalSpy recalculated(&model, &ui::ScheduleViewModel::recalculated);
    QSignalSpy changed(&model, &ui::ScheduleViewModel::assignmentsChanged);

    model.requestRecalculation();
    model.requestRecalculation();
    model.requestRecalculation();
    QVERIFY(model.isRecalculationPending());
    QCOMPARE(recalculated.count(), 0);

    QTRY_COMPARE(recalculated.count(), 1);
    QTest::qWait(150);
    QCOMPARE(recalculated.count(), 1);
    QCOMPARE(changed.count(), 1);
    QVERIFY(!model.isRecalculationPending());
    QVERIFY(model.lastReport().ok);
    QCOMPARE(model.lastReport().assignmentsCreated, 3);
    QCOMPARE(model.assignments().size(), static_cast<size_t>(3));
}

void ScheduleViewModelTest::calendarChangeTriggersRecalculation()
{
    Fixture fixture;
    ui::ScheduleViewModel model(fixture.assignments, *fixture.recalculator);
    model.setDebounceInterval(20);
    QSignalSpy recalculated(&model, &ui::ScheduleViewModel::recalculated);

    model.calendarChanged();
    QVERIFY(model.isRecalculationPending());
    QTRY_COMPARE(recalculated.count(), 1);
    QCOMPARE(fixture.assignments.fetchAssignments().size(), static_cast<size_t>(3));
}

QTEST_GUILESS_MAIN(ScheduleViewModelTest)
#include "ScheduleViewModelTest.moc"
