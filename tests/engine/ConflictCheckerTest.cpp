#include <QtTest/QtTest>

#include "roomboard/engine/ConflictChecker.hpp"

using namespace roomboard;
using namespace roomboard::engine;

namespace {
core::Interval range(const char *start, const char *end)
{
    const QString day = QStringLiteral("2025-11-13 ");
    return core::Interval::fromString(day + QString::fromLatin1(start), day + QString::fromLatin1(end));
}
} // namespace

class ConflictCheckerTest : public QObject
{
    Q_OBJECT

private slots:
    void touchingBoundaryIsFree();
    void partialOverlapReturnsExisting();
    void earliestOverlapperWins();
    void sameStartKeepsInputOrder();
    void insideGapIsFree();
    void enclosingProposalConflicts();
    void returnsWholeBooking();
};

void ConflictCheckerTest::touchingBoundaryIsFree()
{
    QVERIFY(!hasConflict(range("14:00", "15:00"), std::vector<core::Interval>{range("13:30", "14:00")}));
    QVERIFY(!hasConflict(range("14:00", "15:00"), std::vector<core::Interval>{range("15:00", "16:00")}));
}

void ConflictCheckerTest::partialOverlapReturnsExisting()
{
    const auto conflict = hasConflict(range("14:00", "15:00"), std::vector<core::Interval>{range("14:30", "15:30")});
    QVERIFY(conflict.has_value());
    QCOMPARE(*conflict, range("14:30", "15:30"));
}

void ConflictCheckerTest::earliestOverlapperWins()
{
    const std::vector<core::Interval> existing = {range("11:00", "11:30"), range("10:30", "11:00"), range("09:00", "09:30")};
    const auto conflict = hasConflict(range("10:00", "12:00"), existing);
    QVERIFY(conflict.has_value());
    QCOMPARE(*conflict, range("10:30", "11:00"));
}

void ConflictCheckerTest::sameStartKeepsInputOrder()
{
    const std::vector<core::Interval> existing = {range("10:30", "11:30"), range("10:30", "11:00")};
    const auto conflict = hasConflict(range("10:00", "12:00"), existing);
    QVERIFY(conflict.has_value());
    QCOMPARE(*conflict, range("10:30", "11:30"));

    const std::vector<core::Interval> swapped = {range("10:30", "11:00"), range("10:30", "11:30")};
    QCOMPARE(*hasConflict(range("10:00", "12:00"), swapped), range("10:30", "11:00"));

    const std::vector<data::Booking> bookings = {data::Booking{7, 1, range("10:30", "11:30")}, data::Booking{3, 1, range("10:30", "11:00")}};
    QCOMPARE(findConflictingBooking(range("10:00", "12:00"), bookings)->id, qint64(7));
}

void ConflictCheckerTest::insideGapIsFree()
{
    const std::vector<core::Interval> existing = {range("08:00", "09:00"), range("10:00", "11:00"), range("12:00", "13:00")};
    QVERIFY(!hasConflict(range("09:00", "10:00"), existing));
    QVERIFY(!hasConflict(range("11:15", "11:45"), existing));
    QVERIFY(!hasConflict(range("13:00", "20:00"), existing));
}

void ConflictCheckerTest::enclosingProposalConflicts()
{
    const auto conflict = hasConflict(range("09:00", "12:00"), std::vector<core::Interval>{range("10:00", "10:15")});
    QVERIFY(conflict.has_value());
    QVERIFY(!hasConflict(range("09:00", "12:00"), std::vector<core::Interval>{}));
}

void ConflictCheckerTest::returnsWholeBooking()
{
    const std::vector<data::Booking> bookings = {data::Booking{7, 1, range("14:30", "15:30"), QStringLiteral("Review")},
                                                 data::Booking{8, 1, range("15:30", "16:00"), QStringLiteral("Retro")}};
    const auto booking = findConflictingBooking(range("14:00", "16:00"), bookings);
    QVERIFY(booking.has_value());
    QCOMPARE(booking->id, qint64(7));
    QCOMPARE(booking->title, QStringLiteral("Review"));

    const auto interval = hasConflict(range("15:45", "16:30"), bookings);
    QVERIFY(interval.has_value());
    QCOMPARE(*interval, range("15:30", "16:00"));
}

QTEST_GUILESS_MAIN(ConflictCheckerTest)
#include "ConflictCheckerTest.moc"
