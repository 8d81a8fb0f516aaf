#include <QtTest/QtTest>

#include "timebox/engine/ConflictFilter.hpp"

using namespace timebox;

namespace {
QDateTime at(int day, int hour, int minute = 0)
{
    return QDateTime(QDate(2024, 1, day), QTime(hour, minute), Qt::UTC);
}

engine::TimeSlot slot(const QDateTime &start, const QDateTime &end)
{
    engine::TimeSlot slot;
    slot.start = start;
    slot.end = end;
    slot.durationHours = start.secsTo(end) / 3600.0;
    return slot;
}

std::vector<engine::TimeSlot> morningSlots()
{
    return { slot(at(1, 9), at(1, 10)), slot(at(2, 9), at(2, 10)), slot(at(3, 9), at(3, 10)) };
}
} // namespace

class ConflictFilterTest : public QObject
{
    Q_OBJECT

private slots:
    void emptyBusyListChangesNothing();
    void touchingRangesDoNotOverlap();
    void partialOverlapBlocksWholeSlot();
    void ignoresIncompleteIntervals();
    void blockingTwiceIsIdempotent();
};

void ConflictFilterTest::emptyBusyListChangesNothing()
{
    auto slots = morningSlots();
    QCOMPARE(engine::blockConflicting(slots, {}), 0);
    for (const auto &s : slots) {
        QVERIFY(s.available);
    }
}

void ConflictFilterTest::touchingRangesDoNotOverlap()
{
    QVERIFY(!engine::overlaps(at(1, 9), at(1, 10), at(1, 10), at(1, 11)));
    QVERIFY(!engine::overlaps(at(1, 10), at(1, 11), at(1, 9), at(1, 10)));

    auto slots = morningSlots();
    const std::vector<data::BusyInterval> busy{ { at(1, 10), at(1, 11) }, { at(2, 8), at(2, 9) } };
    QCOMPARE(engine::blockConflicting(slots, busy), 0);
}

void ConflictFilterTest::partialOverlapBlocksWholeSlot()
{
    auto slots = morningSlots();
    const std::vector<data::BusyInterval> busy{ { at(2, 9, 45), at(2, 11) } };
    QCOMPARE(engine::blockConflicting(slots, busy), 1);
    QVERIFY(slots.at(0).available);
    QVERIFY(!slots.at(1).available);
    QVERIFY(slots.at(2).available);
}

void ConflictFilterTest::ignoresIncompleteIntervals()
{
    auto slots = morningSlots();
    const std::vector<data::BusyInterval> busy{ { at(1, 9), QDateTime() }, { QDateTime(), at(2, 10) } };
    QCOMPARE(engine::blockConflicting(slots, busy), 0);
    QVERIFY(!engine::overlapsAny(at(1, 9), at(1, 10), busy));
}

void ConflictFilterTest::blockingTwiceIsIdempotent()
{
    auto slots = morningSlots();
    const std::vector<data::BusyInterval> busy{ { at(1, 8), at(3, 9, 30) } };
    QCOMPARE(engine::blockConflicting(slots, busy), 3);
    QCOMPARE(engine::blockConflicting(slots, busy), 0);
    for (const auto &s : slots) {
        QVERIFY(!s.available);
    }
}

QTEST_GUILESS_MAIN(ConflictFilterTest)
#include "ConflictFilterTest.moc"
