#include <QtTest/QtTest>

#include "roomboard/data/InMemoryBookingRepository.hpp"
#include "roomboard/ui/viewmodels/RoomStatusViewModel.hpp"

using namespace roomboard;

namespace {
data::Booking booking(int roomId, const char *start, const char *end, const char *title = "")
{
    const QString day = QStringLiteral("2025-11-13 ");
    return data::Booking{0, roomId, core::Interval::fromString(day + QString::fromLatin1(start), day + QString::fromLatin1(end)), QString::fromLatin1(title)};
}

core::TimePoint at(int hour, int minute)
{
    return core::TimePoint(2025, 11, 13, hour, minute);
}

data::RoomConfig room(int id)
{
    data::RoomConfig config;
    config.id = id;
    config.name = QStringLiteral("Room %1").arg(id);
    return config;
}
} // namespace

class RoomStatusViewModelTest : public QObject
{
    Q_OBJECT

private slots:
    void refreshComputesStatus();
    void emitsOnlyOnChange();
    void specialStateDisablesCard();
    void roomHoursDriveDailyLoad();
};

void RoomStatusViewModelTest::refreshComputesStatus()
{
    data::InMemoryBookingRepository repo;
    QVERIFY(repo.addBooking(booking(1, "09:00", "10:00", "Standup")).has_value());
    QVERIFY(repo.addBooking(booking(1, "10:00", "11:30", "Planning")).has_value());
    QVERIFY(repo.addBooking(booking(2, "09:00", "18:00")).has_value());

    ui::RoomStatusViewModel model(repo, room(1), core::Settings());
    model.refresh(at(9, 30));
    QCOMPARE(model.bookingsToday().size(), static_cast<std::size_t>(2));
    QCOMPARE(model.status().kind, engine::StatusKind::Occupied);
    QCOMPARE(model.status().label, QStringLiteral("Occupied until 11:30"));
    QVERIFY(model.timeline().has_value());
    QCOMPARE(model.timeline()->segments.size(), static_cast<std::size_t>(2));
    QVERIFY(model.isInteractive());

    model.refresh(at(12, 0));
    QCOMPARE(model.status().kind, engine::StatusKind::AvailableAllDay);
    QVERIFY(!model.timeline().has_value());
}

void RoomStatusViewModelTest::emitsOnlyOnChange()
{
    data::InMemoryBookingRepository repo;
    QVERIFY(repo.addBooking(booking(1, "14:00", "15:00")).has_value());

    ui::RoomStatusViewModel model(repo, room(1), core::Settings());
    QSignalSpy spy(&model, &ui::RoomStatusViewModel::statusChanged);
    model.refresh(at(12, 0));
    model.refresh(at(12, 0));
    QCOMPARE(spy.count(), 1);

    model.refresh(at(12, 1));
    QCOMPARE(spy.count(), 2);
    QCOMPARE(*model.status().minutesUntilNext, qint64(119));
}

void RoomStatusViewModelTest::specialStateDisablesCard()
{
    data::InMemoryBookingRepository repo;
    QVERIFY(repo.addBooking(booking(1, "09:00", "10:00")).has_value());

    data::RoomConfig config = room(1);
    config.specialState = data::SpecialState::Maintenance;
    ui::RoomStatusViewModel model(repo, config, core::Settings());
    model.refresh(at(9, 30));
    QCOMPARE(model.status().kind, engine::StatusKind::Maintenance);
    QVERIFY(!model.isInteractive());
    QVERIFY(!model.timeline().has_value());

    model.setRoom(room(1));
    model.refresh(at(9, 30));
    QCOMPARE(model.status().kind, engine::StatusKind::Occupied);
    QVERIFY(model.isInteractive());
}

void RoomStatusViewModelTest::roomHoursDriveDailyLoad()
{
    data::InMemoryBookingRepository repo;
    QVERIFY(repo.addBooking(booking(1, "10:00", "13:00")).has_value());

    // Three of twelve default hours is a light day.
    ui::RoomStatusViewModel model(repo, room(1), core::Settings());
    model.refresh(at(11, 0));
    QCOMPARE(model.status().kind, engine::StatusKind::Occupied);

    // Three of four hours when the room opens only 10:00-14:00.
    data::RoomConfig shortDay = room(1);
    shortDay.window = core::BusinessWindow(10 * 60, 14 * 60);
    model.setRoom(shortDay);
    model.refresh(at(11, 0));
    QCOMPARE(model.status().kind, engine::StatusKind::FullyBooked);

    core::Settings developer;
    developer.developerMode = true;
    ui::RoomStatusViewModel lifted(repo, shortDay, developer);
    lifted.refresh(at(11, 0));
    QCOMPARE(lifted.status().kind, engine::StatusKind::Occupied);
}

QTEST_GUILESS_MAIN(RoomStatusViewModelTest)
#include "RoomStatusViewModelTest.moc"
