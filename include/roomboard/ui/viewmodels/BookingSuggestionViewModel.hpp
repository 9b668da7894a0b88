#pragma once

#include <QDate>
#include <QObject>
#include <optional>
#include <vector>

#include "roomboard/core/Interval.hpp"
#include "roomboard/core/Settings.hpp"
#include "roomboard/data/Booking.hpp"
#include "roomboard/data/Room.hpp"

namespace roomboard {
namespace data {
class BookingRepository;
}

namespace ui {

// Booking form state: suggested slots for a room-day, the selected
// suggestion, and the conflict for a manually entered range.
class BookingSuggestionViewModel : public QObject
{
    Q_OBJECT

public:
    BookingSuggestionViewModel(data::BookingRepository &repository,
                               data::RoomConfig room,
                               core::Settings settings,
                               QObject *parent = nullptr);

    // Loads the day and auto-selects the first suggestion, if any.
    void setDay(const core::TimePoint &now, const QDate &day);
    void setDurationMinutes(int minutes);
    bool selectSlot(int index);
    // Manual entry: clears the selected suggestion and checks for conflicts.
    void setProposed(const core::Interval &proposed);

    const QDate &day() const;
    int durationMinutes() const;
    const std::vector<core::Interval> &suggestions() const;
    std::optional<int> selectedIndex() const;
    const std::optional<core::Interval> &proposed() const;
    const std::optional<data::Booking> &conflict() const;
    const std::vector<core::TimePoint> &availableStartTimes() const;

signals:
    void suggestionsChanged(const std::vector<roomboard::core::Interval> &suggestions);
    void conflictChanged(bool hasConflict);

private:
    void recompute();
    void checkConflict();

    data::BookingRepository &m_repository;
    data::RoomConfig m_room;
    core::Settings m_settings;
    int m_durationMinutes = 0;
    core::TimePoint m_now;
    QDate m_day;
    std::vector<data::Booking> m_dayBookings;
    std::vector<core::Interval> m_suggestions;
    std::vector<core::TimePoint> m_availableStartTimes;
    std::optional<int> m_selectedIndex;
    std::optional<core::Interval> m_proposed;
    std::optional<data::Booking> m_conflict;
};

} // namespace ui
} // namespace roomboard
