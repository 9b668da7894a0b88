#include "roomboard/engine/Timeline.hpp"

#include <QtGlobal>
#include <algorithm>

#include "roomboard/core/ConfigurationError.hpp"
#include "roomboard/engine/BlockMerger.hpp"

namespace roomboard {
namespace engine {

const TimelineSegment *LiveTimeline::currentSegment() const
{
    if (currentSegmentIndex < 0 || currentSegmentIndex >= static_cast<int>(segments.size())) {
        return nullptr;
    }
    return &segments[static_cast<std::size_t>(currentSegmentIndex)];
}

QString LiveTimeline::countdownText() const
{
    return core::formatCountdown(currentSegmentRemainingSeconds);
}

std::optional<LiveTimeline> buildTimeline(const core::TimePoint &now, const std::vector<data::Booking> &bookingsToday)
{
    if (now.isNull()) {
        throw core::ConfigurationError(QStringLiteral("timeline requires a current time"));
    }

    const data::Booking *running = nullptr;
    for (const data::Booking &booking : bookingsToday) {
        if (booking.interval.contains(now) && (!running || booking.interval.start() < running->interval.start())) {
            running = &booking;
        }
    }
    if (!running) {
        return std::nullopt;
    }

    const std::vector<data::Booking> chain = blockContaining(*running, bookingsToday);
    LiveTimeline timeline;
    timeline.blockStart = chain.front().interval.start();
    timeline.blockEnd = chain.front().interval.end();
    for (const data::Booking &booking : chain) {
        timeline.blockEnd = std::max(timeline.blockEnd, booking.interval.end());
    }
    const double blockSeconds = static_cast<double>(core::diffSeconds(timeline.blockStart, timeline.blockEnd));

    for (const data::Booking &booking : chain) {
        TimelineSegment segment{booking.id, booking.title, booking.interval};
        segment.durationMinutes = booking.interval.durationMinutes();
        segment.widthFraction = booking.interval.durationSeconds() / blockSeconds;
        if (timeline.currentSegmentIndex < 0 && booking.interval.contains(now)) {
            timeline.currentSegmentIndex = static_cast<int>(timeline.segments.size());
            const double elapsed = static_cast<double>(core::diffSeconds(booking.interval.start(), now));
            timeline.currentSegmentProgress = qBound(0.0, elapsed / booking.interval.durationSeconds(), 1.0);
            timeline.currentSegmentRemainingSeconds = qMax<qint64>(core::diffSeconds(now, booking.interval.end()), 0);
        }
        timeline.segments.push_back(segment);
    }

    for (const data::Booking &booking : bookingsToday) {
        if (booking.interval.start() < timeline.blockEnd) {
            continue;
        }
        if (!timeline.nextBooking || booking.interval.start() < timeline.nextBooking->interval.start()) {
            timeline.nextBooking = booking;
        }
    }
    return timeline;
}

} // namespace engine
} // namespace roomboard
