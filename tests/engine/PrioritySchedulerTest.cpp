#include <QtTest/QtTest>

#include "timebox/engine/AvailabilityModel.hpp"
#include "timebox/engine/ConflictFilter.hpp"
#include "timebox/engine/PriorityScheduler.hpp"

using namespace timebox;

namespace {
QDateTime at(int day, int hour, int minute = 0)
{
    return QDateTime(QDate(2024, 1, day), QTime(hour, minute), Qt::UTC);
}

data::AvailabilityRule morningRule(QSet<int> weekdays)
{
    data::AvailabilityRule rule;
    rule.name = QStringLiteral("Morning");
    rule.weekdays = std::move(weekdays);
    rule.startTime = QTime(9, 0);
    rule.endTime = QTime(10, 0);
    return rule;
}

data::WorkItem item(const QString &name, double hours, int priority)
{
    data::WorkItem item;
    item.name = name;
    item.estimatedHours = hours;
    item.priority = priority;
    return item;
}

std::vector<engine::TimeSlot> weekdaySlots(int days = 7)
{
    return engine::generateSlots({ morningRule({ 1, 2, 3, 4, 5 }) }, days, at(1, 8), QTimeZone::utc());
}
} // namespace

class PrioritySchedulerTest : public QObject
{
    Q_OBJECT

private slots:
    void fillsConsecutiveDays();
    void skipsBusyDay();
    void rechecksBusyAtCommit();
    void doesNotReusePartiallyUsedSlot();
    void fillsWindowEndingAtMidnight();
    void servesHigherPriorityFirst();
    void equalPrioritiesKeepInputOrder();
    void skipsCompletedItems();
    void reportsUnscheduledRemainder();
    void producesStableIds();
    void computesScheduledSpan();
};

void PrioritySchedulerTest::fillsConsecutiveDays()
{
    const auto report = item("Report", 3.0, 1);
    auto slots = weekdaySlots();
    const auto result = engine::schedule({ report }, slots, {});

    QCOMPARE(result.assignments.size(), static_cast<size_t>(3));
    for (int i = 0; i < 3; ++i) {
        const auto &assignment = result.assignments.at(i);
        QCOMPARE(assignment.start, at(1 + i, 9));
        QCOMPARE(assignment.end, at(1 + i, 10));
        QCOMPARE(assignment.durationHours, 1.0);
        QCOMPARE(assignment.workItemId, report.id);
        QCOMPARE(assignment.workItemName, QStringLiteral("Report"));
        QCOMPARE(assignment.priority, 1);
        QCOMPARE(assignment.color, engine::colorForWorkItem(report.id));
        QVERIFY(assignment.status == data::AssignmentStatus::Scheduled);
        QVERIFY(assignment.remoteEventId.isEmpty());
    }
    QVERIFY(result.unscheduled.empty());
    QVERIFY(!slots.at(0).available);
    QVERIFY(slots.at(3).available);
}

void PrioritySchedulerTest::skipsBusyDay()
{
    const std::vector<data::BusyInterval> busy{ { at(2, 9), at(2, 10) } };
    auto slots = weekdaySlots();
    QCOMPARE(engine::blockConflicting(slots, busy), 1);

    const auto result = engine::schedule({ item("Report", 3.0, 1) }, slots, busy);
    QCOMPARE(result.assignments.size(), static_cast<size_t>(3));
    QCOMPARE(result.assignments.at(0).start, at(1, 9));
    QCOMPARE(result.assignments.at(1).start, at(3, 9));
    QCOMPARE(result.assignments.at(2).start, at(4, 9));
    QCOMPARE(result.commitConflicts, 0);
}

void PrioritySchedulerTest::rechecksBusyAtCommit()
{
    const std::vector<data::BusyInterval> busy{ { at(2, 9, 30), at(2, 11) } };
    auto slots = weekdaySlots();

    const auto result = engine::schedule({ item("Report", 3.0, 1) }, slots, busy);
    QCOMPARE(result.commitConflicts, 1);
    QCOMPARE(result.assignments.size(), static_cast<size_t>(3));
    QCOMPARE(result.assignments.at(1).start, at(3, 9));
    QVERIFY(!slots.at(1).available);
}

void PrioritySchedulerTest::doesNotReusePartiallyUsedSlot()
{
    auto slots = weekdaySlots(1);
    QCOMPARE(slots.size(), static_cast<size_t>(1));

    const auto shortTask = item("Short", 0.5, 1);
    const auto other = item("Other", 1.0, 2);
    const auto result = engine::schedule({ shortTask, other }, slots, {});

    QCOMPARE(result.assignments.size(), static_cast<size_t>(1));
    QCOMPARE(result.assignments.front().workItemId, shortTask.id);
    QCOMPARE(result.assignments.front().start, at(1, 9));
    QCOMPARE(result.assignments.front().end, at(1, 9, 30));
    QCOMPARE(result.assignments.front().durationHours, 0.5);

    QCOMPARE(result.unscheduled.size(), static_cast<size_t>(1));
    QCOMPARE(result.unscheduled.front().workItemId, other.id);
    QCOMPARE(result.unscheduled.front().hours, 1.0);
}

void PrioritySchedulerTest::fillsWindowEndingAtMidnight()
{
    auto late = morningRule({ 1, 2, 3, 4, 5 });
    late.startTime = QTime(23, 0);
    late.endTime = *data::parseClockTime(QStringLiteral("24:00"));
    auto slots = engine::generateSlots({ late }, 7, at(1, 8), QTimeZone::utc());

    const auto result = engine::schedule({ item("Night shift", 1.0, 1) }, slots, {});
    QCOMPARE(result.assignments.size(), static_cast<size_t>(1));
    QCOMPARE(result.assignments.front().start, at(1, 23));
    QCOMPARE(result.assignments.front().end, at(2, 0));
    QCOMPARE(result.assignments.front().durationHours, 1.0);
    QVERIFY(result.unscheduled.empty());
    QVERIFY(slots.at(1).available);
}

void PrioritySchedulerTest::servesHigherPriorityFirst()
{
    auto slots = engine::generateSlots({ morningRule({ 0, 1, 2, 3, 4, 5, 6 }) }, 6, at(1, 8), QTimeZone::utc());
    QCOMPARE(slots.size(), static_cast<size_t>(6));

    const auto second = item("Second", 3.0, 2);
    const auto first = item("First", 3.0, 1);
    const auto result = engine::schedule({ second, first }, slots, {});

    QCOMPARE(result.assignments.size(), static_cast<size_t>(6));
    for (int i = 0; i < 6; ++i) {
        const auto &assignment = result.assignments.at(i);
        QCOMPARE(assignment.start, at(1 + i, 9));
        QCOMPARE(assignment.workItemId, i < 3 ? first.id : second.id);
    }
    QVERIFY(result.unscheduled.empty());
}

void PrioritySchedulerTest::equalPrioritiesKeepInputOrder()
{
    auto slots = weekdaySlots();
    const auto a = item("B listed first", 1.0, 1);
    const auto b = item("A listed second", 1.0, 1);
    const auto result = engine::schedule({ a, b }, slots, {});

    QCOMPARE(result.assignments.size(), static_cast<size_t>(2));
    QCOMPARE(result.assignments.at(0).workItemId, a.id);
    QCOMPARE(result.assignments.at(1).workItemId, b.id);
}

void PrioritySchedulerTest::skipsCompletedItems()
{
    auto done = item("Done", 2.0, 1);
    done.status = data::WorkItemStatus::Completed;
    const auto open = item("Open", 1.0, 2);

    auto slots = weekdaySlots();
    const auto result = engine::schedule({ done, open }, slots, {});
    QCOMPARE(result.assignments.size(), static_cast<size_t>(1));
    QCOMPARE(result.assignments.front().workItemId, open.id);
    QCOMPARE(result.assignments.front().start, at(1, 9));
}

void PrioritySchedulerTest::reportsUnscheduledRemainder()
{
    auto slots = weekdaySlots();
    const auto big = item("Big", 7.5, 1);
    const auto result = engine::schedule({ big }, slots, {});

    QCOMPARE(result.assignments.size(), static_cast<size_t>(5));
    QCOMPARE(result.unscheduled.size(), static_cast<size_t>(1));
    QCOMPARE(result.unscheduled.front().workItemName, QStringLiteral("Big"));
    QCOMPARE(result.unscheduled.front().hours, 2.5);
}

void PrioritySchedulerTest::producesStableIds()
{
    const std::vector<data::WorkItem> items{ item("One", 2.0, 1), item("Two", 1.0, 2) };

    auto firstSlots = weekdaySlots();
    auto secondSlots = weekdaySlots();
    const auto first = engine::schedule(items, firstSlots, {});
    const auto second = engine::schedule(items, secondSlots, {});

    QCOMPARE(first.assignments.size(), second.assignments.size());
    QSet<QUuid> ids;
    for (size_t i = 0; i < first.assignments.size(); ++i) {
        QCOMPARE(first.assignments.at(i).id, second.assignments.at(i).id);
        QCOMPARE(first.assignments.at(i).start, second.assignments.at(i).start);
        ids.insert(first.assignments.at(i).id);
    }
    QCOMPARE(ids.size(), 3);
}

void PrioritySchedulerTest::computesScheduledSpan()
{
    const auto report = item("Report", 3.0, 1);
    auto slots = weekdaySlots();
    auto assignments = engine::schedule({ report }, slots, {}).assignments;

    auto span = engine::scheduledSpan(report.id, assignments);
    QVERIFY(span.has_value());
    QCOMPARE(span->start, at(1, 9));
    QCOMPARE(span->end, at(3, 10));

    assignments.back().status = data::AssignmentStatus::Conflicted;
    span = engine::scheduledSpan(report.id, assignments);
    QVERIFY(span.has_value());
    QCOMPARE(span->end, at(2, 10));

    QVERIFY(!engine::scheduledSpan(QUuid::createUuid(), assignments).has_value());
}

QTEST_GUILESS_MAIN(PrioritySchedulerTest)
#include "PrioritySchedulerTest.moc"
