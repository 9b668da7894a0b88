#pragma once

#include <optional>
#include <vector>

#include "roomboard/core/BusinessWindow.hpp"
#include "roomboard/data/Booking.hpp"
#include "roomboard/data/Room.hpp"
#include "roomboard/engine/StatusResult.hpp"

namespace roomboard {
namespace engine {

struct DailyLoad
{
    int bookingCount = 0;
    qint64 bookedMinutes = 0;

    static DailyLoad fromBookings(const std::vector<data::Booking> &bookings);
    bool isHeavy(const core::LoadThresholds &thresholds, const core::BusinessWindow &window) const;
};

// Precedence, first match wins: special state, occupied now (fully booked
// when the day is heavy), free until the next booking, free for the rest of
// the day. A booking occupies [start, end), so one starting exactly at `now`
// counts as current.
StatusResult computeStatus(const core::TimePoint &now,
                           data::SpecialState specialState,
                           const std::vector<data::Booking> &bookingsToday,
                           const core::BusinessWindow &window,
                           const core::LoadThresholds &thresholds = {});

// `currentBookingCandidate` is the caller's idea of the running booking; when
// it no longer contains `now` it is ignored and the state is derived from
// `bookingsToday`. Without `dailyLoad` the load is that of `bookingsToday`,
// counting a running candidate the list lacks.
StatusResult computeStatus(const core::TimePoint &now,
                           data::SpecialState specialState,
                           const std::optional<data::Booking> &currentBookingCandidate,
                           const std::vector<data::Booking> &bookingsToday,
                           const core::BusinessWindow &window,
                           const std::optional<DailyLoad> &dailyLoad,
                           const core::LoadThresholds &thresholds = {});

} // namespace engine
} // namespace roomboard
