#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "roomboard/core/Interval.hpp"
#include "roomboard/data/Booking.hpp"

namespace roomboard {
namespace engine {

struct TimelineSegment
{
    qint64 bookingId = 0;
    QString title;
    core::Interval interval;
    qint64 durationMinutes = 0;
    // Share of the whole block, 0..1.
    double widthFraction = 0.0;
};

// The busy block around "now", broken down into its bookings.
struct LiveTimeline
{
    std::vector<TimelineSegment> segments;
    int currentSegmentIndex = -1;
    double currentSegmentProgress = 0.0;
    qint64 currentSegmentRemainingSeconds = 0;
    core::TimePoint blockStart;
    core::TimePoint blockEnd;
    // First booking starting at or after the block end.
    std::optional<data::Booking> nextBooking;

    const TimelineSegment *currentSegment() const;
    QString countdownText() const;
};

// nullopt when no booking occupies `now`.
std::optional<LiveTimeline> buildTimeline(const core::TimePoint &now, const std::vector<data::Booking> &bookingsToday);

} // namespace engine
} // namespace roomboard
