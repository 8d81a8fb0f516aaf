#include <QtTest/QtTest>

#include "timebox/data/InMemoryAvailabilityRepository.hpp"
#include "timebox/data/InMemoryWorkItemRepository.hpp"

using namespace timebox::data;

class WorkItemRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void addAndFetch();
    void updateAndRemove();
    void appendsNewItemsAtLowestPriority();
    void clampsInvalidValues();
    void reorderRenumbersPriorities();
    void reorderKeepsUnlistedItemsBehind();
    void rulesKeepInsertionOrder();
};

void WorkItemRepositoryTest::addAndFetch()
{
    InMemoryWorkItemRepository repo;
    WorkItem item;
    item.name = "Write report";
    item.estimatedHours = 3.0;
    const auto stored = repo.addWorkItem(item);

    QVERIFY(!stored.id.isNull());

    const auto list = repo.fetchWorkItems();
    QCOMPARE(list.size(), static_cast<size_t>(1));
    QCOMPARE(list.front().name, QStringLiteral("Write report"));
    QCOMPARE(list.front().estimatedHours, 3.0);
    QCOMPARE(list.front().priority, 1);

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->name, QStringLiteral("Write report"));
}

void WorkItemRepositoryTest::updateAndRemove()
{
    InMemoryWorkItemRepository repo;
    WorkItem item;
    item.name = "Initial";
    const auto stored = repo.addWorkItem(item);

    WorkItem toUpdate = stored;
    toUpdate.name = "Updated";
    toUpdate.status = WorkItemStatus::Completed;
    QVERIFY(repo.updateWorkItem(toUpdate));

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->name, QStringLiteral("Updated"));
    QVERIFY(fetched->status == WorkItemStatus::Completed);

    WorkItem unknown;
    QVERIFY(!repo.updateWorkItem(unknown));

    QVERIFY(repo.removeWorkItem(stored.id));
    QVERIFY(!repo.findById(stored.id).has_value());
    QVERIFY(!repo.removeWorkItem(stored.id));
}

void WorkItemRepositoryTest::appendsNewItemsAtLowestPriority()
{
    InMemoryWorkItemRepository repo;
    WorkItem first;
    first.name = "First";
    first.priority = 7;
    WorkItem second;
    second.name = "Second";

    QCOMPARE(repo.addWorkItem(first).priority, 1);
    QCOMPARE(repo.addWorkItem(second).priority, 2);

    const auto list = repo.fetchWorkItems();
    QCOMPARE(list.at(0).name, QStringLiteral("First"));
    QCOMPARE(list.at(1).name, QStringLiteral("Second"));
}

void WorkItemRepositoryTest::clampsInvalidValues()
{
    InMemoryWorkItemRepository repo;
    WorkItem item;
    item.name = "Negative";
    item.estimatedHours = -2.0;
    auto stored = repo.addWorkItem(item);
    QCOMPARE(stored.estimatedHours, 0.0);

    stored.priority = 0;
    QVERIFY(repo.updateWorkItem(stored));
    QCOMPARE(repo.findById(stored.id)->priority, 1);
}

void WorkItemRepositoryTest::reorderRenumbersPriorities()
{
    InMemoryWorkItemRepository repo;
    std::vector<QUuid> ids;
    for (const char *name : { "A", "B", "C" }) {
        WorkItem item;
        item.name = name;
        ids.push_back(repo.addWorkItem(item).id);
    }

    QVERIFY(repo.reorder({ ids.at(2), ids.at(0), ids.at(1) }));

    const auto list = repo.fetchWorkItems();
    QCOMPARE(list.at(0).name, QStringLiteral("C"));
    QCOMPARE(list.at(1).name, QStringLiteral("A"));
    QCOMPARE(list.at(2).name, QStringLiteral("B"));
    for (int i = 0; i < 3; ++i) {
        QCOMPARE(list.at(i).priority, i + 1);
    }
}

void WorkItemRepositoryTest::reorderKeepsUnlistedItemsBehind()
{
    InMemoryWorkItemRepository repo;
    std::vector<QUuid> ids;
    for (const char *name : { "A", "B", "C" }) {
        WorkItem item;
        item.name = name;
        ids.push_back(repo.addWorkItem(item).id);
    }

    QVERIFY(repo.reorder({ ids.at(1), QUuid::createUuid() }));

    const auto list = repo.fetchWorkItems();
    QCOMPARE(list.at(0).name, QStringLiteral("B"));
    QCOMPARE(list.at(1).name, QStringLiteral("A"));
    QCOMPARE(list.at(2).name, QStringLiteral("C"));
    QCOMPARE(list.at(2).priority, 3);
}

void WorkItemRepositoryTest::rulesKeepInsertionOrder()
{
    InMemoryAvailabilityRepository repo;
    AvailabilityRule evening;
    evening.name = "Evening";
    AvailabilityRule morning;
    morning.name = "Morning";
    const auto storedEvening = repo.addRule(evening);
    repo.addRule(morning);

    auto rules = repo.fetchRules();
    QCOMPARE(rules.size(), static_cast<size_t>(2));
    QCOMPARE(rules.at(0).name, QStringLiteral("Evening"));
    QCOMPARE(rules.at(1).name, QStringLiteral("Morning"));

    QVERIFY(repo.removeRule(storedEvening.id));
    rules = repo.fetchRules();
    QCOMPARE(rules.size(), static_cast<size_t>(1));
    QCOMPARE(rules.front().name, QStringLiteral("Morning"));
}

QTEST_GUILESS_MAIN(WorkItemRepositoryTest)
#include "WorkItemRepositoryTest.moc"
