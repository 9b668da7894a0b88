#include "roomboard/engine/StatusEngine.hpp"

#include <QtGlobal>
#include <algorithm>

#include "roomboard/core/ConfigurationError.hpp"
#include "roomboard/core/Logging.hpp"
#include "roomboard/engine/BlockMerger.hpp"

namespace roomboard {
namespace engine {

namespace {
StatusResult specialStatus(data::SpecialState state)
{
    StatusResult result;
    switch (state) {
    case data::SpecialState::Maintenance:
        result.kind = StatusKind::Maintenance;
        result.label = QStringLiteral("Under maintenance");
        break;
    case data::SpecialState::Inactive:
        result.kind = StatusKind::Inactive;
        result.label = QStringLiteral("Not available");
        break;
    case data::SpecialState::NightRest:
        result.kind = StatusKind::NightRest;
        result.label = QStringLiteral("Night rest");
        break;
    case data::SpecialState::None:
        break;
    }
    return result;
}

std::optional<data::Booking> runningBooking(const core::TimePoint &now, const std::vector<data::Booking> &bookings)
{
    std::optional<data::Booking> running;
    for (const data::Booking &booking : bookings) {
        if (!booking.interval.contains(now)) {
            continue;
        }
        if (!running || booking.interval.start() < running->interval.start()) {
            running = booking;
        }
    }
    return running;
}

std::optional<data::Booking> nextBooking(const core::TimePoint &now, const std::vector<data::Booking> &bookings)
{
    std::optional<data::Booking> next;
    for (const data::Booking &booking : bookings) {
        if (booking.interval.start() <= now) {
            continue;
        }
        if (!next || booking.interval.start() < next->interval.start()) {
            next = booking;
        }
    }
    return next;
}
} // namespace

namespace {
// The day's bookings with `current` added when the snapshot lacks it.
std::vector<data::Booking> withCurrentBooking(const data::Booking &current, const std::vector<data::Booking> &bookingsToday)
{
    const bool listed = std::any_of(bookingsToday.begin(), bookingsToday.end(), [&current](const data::Booking &booking) {
        return booking.id == current.id && booking.interval == current.interval;
    });
    if (listed) {
        return bookingsToday;
    }
    std::vector<data::Booking> day = bookingsToday;
    day.push_back(current);
    return day;
}
} // namespace

DailyLoad DailyLoad::fromBookings(const std::vector<data::Booking> &bookings)
{
    DailyLoad load;
    load.bookingCount = static_cast<int>(bookings.size());
    for (const data::Booking &booking : bookings) {
        load.bookedMinutes += booking.interval.durationMinutes();
    }
    return load;
}

bool DailyLoad::isHeavy(const core::LoadThresholds &thresholds, const core::BusinessWindow &window) const
{
    if (bookingCount >= thresholds.bookingCount) {
        return true;
    }
    const double fraction = static_cast<double>(bookedMinutes) / window.windowMinutes();
    return fraction >= thresholds.bookedFraction;
}

StatusResult computeStatus(const core::TimePoint &now,
                           data::SpecialState specialState,
                           const std::vector<data::Booking> &bookingsToday,
                           const core::BusinessWindow &window,
                           const core::LoadThresholds &thresholds)
{
    return computeStatus(now, specialState, std::nullopt, bookingsToday, window, std::nullopt, thresholds);
}

StatusResult computeStatus(const core::TimePoint &now,
                           data::SpecialState specialState,
                           const std::optional<data::Booking> &currentBookingCandidate,
                           const std::vector<data::Booking> &bookingsToday,
                           const core::BusinessWindow &window,
                           const std::optional<DailyLoad> &dailyLoad,
                           const core::LoadThresholds &thresholds)
{
    if (now.isNull()) {
        throw core::ConfigurationError(QStringLiteral("status requires a current time"));
    }

    if (specialState != data::SpecialState::None) {
        return specialStatus(specialState);
    }

    std::optional<data::Booking> current;
    if (currentBookingCandidate) {
        if (currentBookingCandidate->interval.contains(now)) {
            current = currentBookingCandidate;
        } else {
            qCDebug(lcEngine) << "ignoring stale current booking" << currentBookingCandidate->id
                              << currentBookingCandidate->interval.toString() << "at" << now.toString();
        }
    }
    if (!current) {
        current = runningBooking(now, bookingsToday);
    }

    StatusResult result;
    if (current) {
        const std::vector<data::Booking> chain = blockContaining(*current, bookingsToday);
        core::TimePoint blockEnd = current->interval.end();
        for (const data::Booking &segment : chain) {
            blockEnd = std::max(blockEnd, segment.interval.end());
        }

        const DailyLoad load = dailyLoad ? *dailyLoad : DailyLoad::fromBookings(withCurrentBooking(*current, bookingsToday));
        if (load.isHeavy(thresholds, window)) {
            result.kind = StatusKind::FullyBooked;
            result.label = QStringLiteral("Fully booked today");
            result.progressFraction = 0.0;
            return result;
        }

        const qint64 total = core::diffSeconds(current->interval.start(), blockEnd);
        const qint64 elapsed = core::diffSeconds(current->interval.start(), now);
        result.kind = StatusKind::Occupied;
        result.label = QStringLiteral("Occupied until %1").arg(blockEnd.toHHMM());
        result.until = blockEnd;
        result.progressFraction = qBound(0.0, static_cast<double>(elapsed) / total, 1.0);
        result.remainingSeconds = std::max<qint64>(core::diffSeconds(now, blockEnd), 0);
        return result;
    }

    if (const auto next = nextBooking(now, bookingsToday)) {
        const qint64 seconds = core::diffSeconds(now, next->interval.start());
        result.kind = StatusKind::AvailableUntil;
        result.label = QStringLiteral("Available until %1").arg(next->interval.start().toHHMM());
        result.until = next->interval.start();
        result.minutesUntilNext = seconds / 60;
        return result;
    }

    result.kind = StatusKind::AvailableAllDay;
    result.label = QStringLiteral("Available all day");
    return result;
}

} // namespace engine
} // namespace roomboard
