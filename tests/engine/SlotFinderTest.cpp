#include <QtTest/QtTest>

#include "roomboard/core/ConfigurationError.hpp"
#include "roomboard/engine/ConflictChecker.hpp"
#include "roomboard/engine/SlotFinder.hpp"

using namespace roomboard;
using namespace roomboard::engine;

namespace {
const QDate DAY(2025, 11, 13);

core::TimePoint at(int hour, int minute, int second = 0)
{
    return core::TimePoint(DAY, QTime(hour, minute, second));
}

core::Interval range(int startHour, int startMinute, int endHour, int endMinute)
{
    return core::Interval(at(startHour, startMinute), at(endHour, endMinute));
}
} // namespace

class SlotFinderTest : public QObject
{
    Q_OBJECT

private slots:
    void earlyMorningStartsAtOpening();
    void roundsNowUpToGranularity();
    void roundingCarriesIntoNextHour();
    void exactGridMinuteIsKept();
    void futureDayStartsAtOpening();
    void pastDayHasNoSlots();
    void skipsBookedRangesAndStepsByGranularity();
    void stopsAtClosingTime();
    void slotsAreConflictFreeAndInsideWindow();
    void noRoomLeftGivesEmptyList();
    void developerWindowRunsToMidnight();
    void rejectsBadRequests();
    void listsAvailableStartTimes();
};

void SlotFinderTest::earlyMorningStartsAtOpening()
{
    const auto slots = findNextSlots(at(7, 0), DAY, core::BusinessWindow(), 30, 4, std::vector<core::Interval>{});
    QCOMPARE(slots.size(), static_cast<std::size_t>(4));
    QCOMPARE(slots.front(), range(8, 0, 8, 30));
    // Alternatives overlap: each starts one step after the previous one.
    QCOMPARE(slots[1], range(8, 15, 8, 45));
    QCOMPARE(slots[3], range(8, 45, 9, 15));
}

void SlotFinderTest::roundsNowUpToGranularity()
{
    QCOMPARE(searchStart(at(10, 7, 30), DAY, core::BusinessWindow()), at(10, 15));
    const auto slots = findNextSlots(at(10, 7, 30), DAY, core::BusinessWindow(), 30, 1, std::vector<core::Interval>{});
    QCOMPARE(slots.size(), static_cast<std::size_t>(1));
    QCOMPARE(slots.front(), range(10, 15, 10, 45));
}

void SlotFinderTest::roundingCarriesIntoNextHour()
{
    QCOMPARE(searchStart(at(10, 52), DAY, core::BusinessWindow()), at(11, 0));
    QCOMPARE(searchStart(at(23, 50), DAY, core::BusinessWindow::allDay()), core::TimePoint(2025, 11, 14, 0, 0));
}

void SlotFinderTest::exactGridMinuteIsKept()
{
    QCOMPARE(searchStart(at(10, 30), DAY, core::BusinessWindow()), at(10, 30));
    // Seconds are dropped, not rounded.
    QCOMPARE(searchStart(at(10, 30, 40), DAY, core::BusinessWindow()), at(10, 30));
}

void SlotFinderTest::futureDayStartsAtOpening()
{
    const QDate tomorrow = DAY.addDays(1);
    const auto slots = findNextSlots(at(16, 40), tomorrow, core::BusinessWindow(), 30, 2, std::vector<core::Interval>{});
    QCOMPARE(slots.size(), static_cast<std::size_t>(2));
    QCOMPARE(slots.front().start(), core::TimePoint(2025, 11, 14, 8, 0));
}

void SlotFinderTest::pastDayHasNoSlots()
{
    QVERIFY(findNextSlots(at(9, 0), DAY.addDays(-1), core::BusinessWindow(), 30, 4, std::vector<core::Interval>{}).empty());
}

void SlotFinderTest::skipsBookedRangesAndStepsByGranularity()
{
    const std::vector<core::Interval> existing = {range(8, 0, 9, 0), range(9, 30, 10, 0)};
    const auto slots = findNextSlots(at(7, 30), DAY, core::BusinessWindow(), 30, 3, existing);
    QCOMPARE(slots.size(), static_cast<std::size_t>(3));
    QCOMPARE(slots[0], range(9, 0, 9, 30));
    QCOMPARE(slots[1], range(10, 0, 10, 30));
    QCOMPARE(slots[2], range(10, 15, 10, 45));
}

void SlotFinderTest::stopsAtClosingTime()
{
    const auto slots = findNextSlots(at(19, 5), DAY, core::BusinessWindow(), 30, 10, std::vector<core::Interval>{});
    QCOMPARE(slots.size(), static_cast<std::size_t>(2));
    QCOMPARE(slots[0], range(19, 15, 19, 45));
    QCOMPARE(slots[1], range(19, 30, 20, 0));
}

void SlotFinderTest::slotsAreConflictFreeAndInsideWindow()
{
    const core::BusinessWindow window(9 * 60, 17 * 60, 10, 45);
    const std::vector<core::Interval> existing = {range(9, 0, 9, 50), range(10, 20, 11, 40), range(12, 0, 16, 30)};
    const auto slots = findNextSlots(at(8, 0), DAY, window, 45, 20, existing);
    QVERIFY(!slots.empty());
    for (const core::Interval &slot : slots) {
        QVERIFY(!hasConflict(slot, existing));
        QVERIFY(window.contains(slot, DAY));
        QCOMPARE(slot.durationMinutes(), qint64(45));
    }
}

void SlotFinderTest::noRoomLeftGivesEmptyList()
{
    const std::vector<data::Booking> bookings = {data::Booking{1, 1, range(8, 0, 20, 0)}};
    QVERIFY(findNextSlots(at(7, 0), DAY, core::BusinessWindow(), 30, 4, bookings).empty());
    QVERIFY(findNextSlots(at(7, 0), DAY, core::BusinessWindow(), 30, 0, std::vector<core::Interval>{}).empty());
}

void SlotFinderTest::developerWindowRunsToMidnight()
{
    const auto slots = findNextSlots(at(23, 10), DAY, core::BusinessWindow::allDay(), 30, 4, std::vector<core::Interval>{});
    QCOMPARE(slots.size(), static_cast<std::size_t>(2));
    QCOMPARE(slots[0].start(), at(23, 15));
    QCOMPARE(slots[1].end(), core::TimePoint(2025, 11, 14, 0, 0));
}

void SlotFinderTest::rejectsBadRequests()
{
    const std::vector<core::Interval> none;
    QVERIFY_EXCEPTION_THROWN(findNextSlots(at(9, 0), DAY, core::BusinessWindow(), 0, 4, none), core::ConfigurationError);
    QVERIFY_EXCEPTION_THROWN(findNextSlots(at(9, 0), DAY, core::BusinessWindow(), -15, 4, none), core::ConfigurationError);
    QVERIFY_EXCEPTION_THROWN(findNextSlots(at(9, 0), DAY, core::BusinessWindow(), 30, -1, none), core::ConfigurationError);
    QVERIFY_EXCEPTION_THROWN(findNextSlots(core::TimePoint(), DAY, core::BusinessWindow(), 30, 4, none), core::ConfigurationError);
}

void SlotFinderTest::listsAvailableStartTimes()
{
    const core::BusinessWindow window(8 * 60, 10 * 60, 30, 30);
    const std::vector<data::Booking> bookings = {data::Booking{1, 1, range(9, 0, 9, 30)}};
    const auto starts = availableStartTimes(at(8, 10), DAY, window, 30, bookings);
    // 08:00 is still running at 08:10 so it stays selectable; 09:00 is booked.
    QCOMPARE(starts.size(), static_cast<std::size_t>(3));
    QCOMPARE(starts[0], at(8, 0));
    QCOMPARE(starts[1], at(8, 30));
    QCOMPARE(starts[2], at(9, 30));

    const auto later = availableStartTimes(at(8, 30), DAY, window, 30, bookings);
    QCOMPARE(later.front(), at(8, 30));
}

QTEST_GUILESS_MAIN(SlotFinderTest)
#include "SlotFinderTest.moc"
