#include <QtTest/QtTest>

#include <QBuffer>
#include <QTemporaryDir>

#include "timebox/data/AssignmentRepository.hpp"
#include "timebox/data/AvailabilityRepository.hpp"
#include "timebox/data/DataProvider.hpp"
#include "timebox/data/IcsFormat.hpp"
#include "timebox/data/WorkItemRepository.hpp"

using namespace timebox::data;

namespace {
QDateTime at(int day, int hour, int minute = 0)
{
    return QDateTime(QDate(2024, 1, day), QTime(hour, minute), Qt::UTC);
}
} // namespace

class FileScheduleStorageTest : public QObject
{
    Q_OBJECT

private slots:
    void persistsAcrossReload();
    void removingItemDropsOpenAssignments();
    void replacesOnlyOpenAssignments();
    void failedWriteKeepsPreviousState();
    void escapesText();
    void unfoldsContinuationLines();
};

void FileScheduleStorageTest::persistsAcrossReload()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("schedule.ics");

    QUuid itemId;
    QUuid ruleId;
    QUuid assignmentId = QUuid::createUuid();
    {
        DataProvider provider(path);
        WorkItem item;
        item.name = "Report; draft, v2";
        item.description = "First line\nSecond line";
        item.dueDate = at(15, 17);
        item.estimatedHours = 2.5;
        item.status = WorkItemStatus::Scheduled;
        itemId = provider.workItemRepository().addWorkItem(item).id;

        AvailabilityRule rule;
        rule.name = "Evenings";
        rule.weekdays = { 1, 3 };
        rule.startTime = QTime(18, 0);
        rule.endTime = QTime(23, 59, 59, 999);
        rule.active = false;
        rule.minimumDurationMinutes = 30;
        ruleId = provider.availabilityRepository().addRule(rule).id;

        Assignment assignment;
        assignment.id = assignmentId;
        assignment.workItemId = itemId;
        assignment.workItemName = item.name;
        assignment.start = at(1, 18);
        assignment.end = at(1, 20, 30);
        assignment.durationHours = 2.5;
        assignment.status = AssignmentStatus::Conflicted;
        assignment.priority = 1;
        assignment.color = "#3B82F6";
        assignment.remoteEventId = "abc@timebox";
        QVERIFY(provider.assignmentRepository().addAssignments({ assignment }));
    }

    DataProvider reloaded(path);

    const auto item = reloaded.workItemRepository().findById(itemId);
    QVERIFY(item.has_value());
    QCOMPARE(item->name, QStringLiteral("Report; draft, v2"));
    QCOMPARE(item->description, QStringLiteral("First line\nSecond line"));
    QCOMPARE(item->dueDate, at(15, 17));
    QCOMPARE(item->estimatedHours, 2.5);
    QCOMPARE(item->priority, 1);
    QVERIFY(item->status == WorkItemStatus::Scheduled);

    const auto rule = reloaded.availabilityRepository().findById(ruleId);
    QVERIFY(rule.has_value());
    QCOMPARE(rule->name, QStringLiteral("Evenings"));
    QCOMPARE(rule->weekdays, (QSet<int>{ 1, 3 }));
    QCOMPARE(rule->startTime, QTime(18, 0));
    QCOMPARE(rule->endTime, QTime(23, 59, 59, 999));
    QVERIFY(!rule->active);
    QCOMPARE(rule->minimumDurationMinutes, 30);

    const auto assignment = reloaded.assignmentRepository().findById(assignmentId);
    QVERIFY(assignment.has_value());
    QCOMPARE(assignment->workItemId, itemId);
    QCOMPARE(assignment->start, at(1, 18));
    QCOMPARE(assignment->end, at(1, 20, 30));
    QCOMPARE(assignment->durationHours, 2.5);
    QVERIFY(assignment->status == AssignmentStatus::Conflicted);
    QCOMPARE(assignment->color, QStringLiteral("#3B82F6"));
    QCOMPARE(assignment->remoteEventId, QStringLiteral("abc@timebox"));
}

void FileScheduleStorageTest::removingItemDropsOpenAssignments()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    DataProvider provider(dir.filePath("schedule.ics"));

    WorkItem item;
    item.name = "Temporary";
    const auto stored = provider.workItemRepository().addWorkItem(item);

    Assignment open;
    open.id = QUuid::createUuid();
    open.workItemId = stored.id;
    open.start = at(1, 9);
    open.end = at(1, 10);
    Assignment done = open;
    done.id = QUuid::createUuid();
    done.start = at(2, 9);
    done.end = at(2, 10);
    done.status = AssignmentStatus::Completed;
    QVERIFY(provider.assignmentRepository().addAssignments({ open, done }));

    QVERIFY(provider.workItemRepository().removeWorkItem(stored.id));
    const auto remaining = provider.assignmentRepository().fetchAssignments();
    QCOMPARE(remaining.size(), static_cast<size_t>(1));
    QCOMPARE(remaining.front().id, done.id);
}

void FileScheduleStorageTest::replacesOnlyOpenAssignments()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    DataProvider provider(dir.filePath("schedule.ics"));
    auto &repo = provider.assignmentRepository();

    Assignment done;
    done.id = QUuid::createUuid();
    done.start = at(1, 9);
    done.end = at(1, 10);
    done.status = AssignmentStatus::Completed;
    Assignment open = done;
    open.id = QUuid::createUuid();
    open.start = at(2, 9);
    open.end = at(2, 10);
    open.status = AssignmentStatus::Scheduled;
    QVERIFY(repo.addAssignments({ done, open }));

    Assignment replacement = open;
    replacement.id = QUuid::createUuid();
    replacement.start = at(3, 9);
    replacement.end = at(3, 10);
    QVERIFY(repo.replaceOpenAssignments({ replacement }));

    const auto all = repo.fetchAssignments();
    QCOMPARE(all.size(), static_cast<size_t>(2));
    QCOMPARE(all.at(0).id, done.id);
    QCOMPARE(all.at(1).id, replacement.id);
    QCOMPARE(repo.fetchAssignments(QDate(2024, 1, 3), QDate(2024, 1, 3)).size(), static_cast<size_t>(1));

    QVERIFY(repo.clearOpenAssignments());
    QCOMPARE(repo.fetchAssignments().size(), static_cast<size_t>(1));
}

void FileScheduleStorageTest::failedWriteKeepsPreviousState()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    // A regular file where the storage directory should be makes every write fail.
    QFile blocker(dir.filePath("blocker"));
    QVERIFY(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    DataProvider provider(dir.filePath("blocker/schedule.ics"));
    Assignment assignment;
    assignment.id = QUuid::createUuid();
    assignment.start = at(1, 9);
    assignment.end = at(1, 10);

    QVERIFY(!provider.assignmentRepository().addAssignments({ assignment }));
    QVERIFY(provider.assignmentRepository().fetchAssignments().empty());
    QVERIFY(!provider.assignmentRepository().clearOpenAssignments());
}

void FileScheduleStorageTest::escapesText()
{
    const QString text = QStringLiteral("a;b,c\\d\nnext \\n literal");
    const QString encoded = ics::encodeText(text);
    QVERIFY(!encoded.contains('\n'));
    QCOMPARE(ics::decodeText(encoded), text);
}

void FileScheduleStorageTest::unfoldsContinuationLines()
{
    QByteArray content("BEGIN:VEVENT\r\nSUMMARY:Long\r\n  title\r\nDTSTART;TZID=UTC:20240101T090000\r\nEND:VEVENT\r\n");
    QBuffer buffer(&content);
    QVERIFY(buffer.open(QIODevice::ReadOnly));

    const QStringList lines = ics::readUnfoldedLines(buffer);
    QCOMPARE(lines.size(), 4);
    QCOMPARE(lines.at(1), QStringLiteral("SUMMARY:Long title"));

    IcsProperty property;
    QVERIFY(ics::parseProperty(lines.at(2), property));
    QCOMPARE(property.name, QStringLiteral("DTSTART"));
    QCOMPARE(property.parameters, QStringLiteral("TZID=UTC"));
    QCOMPARE(ics::parseDateTime(property.rawValue, property.parameters).toMSecsSinceEpoch(),
             at(1, 9).toMSecsSinceEpoch());
}

QTEST_GUILESS_MAIN(FileScheduleStorageTest)
#include "FileScheduleStorageTest.moc"
