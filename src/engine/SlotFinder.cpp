#include "roomboard/engine/SlotFinder.hpp"

#include <algorithm>

#include "roomboard/core/ConfigurationError.hpp"
#include "roomboard/core/Logging.hpp"
#include "roomboard/engine/ConflictChecker.hpp"

namespace roomboard {
namespace engine {

namespace {
void validateRequest(const core::TimePoint &now, const QDate &day, int durationMinutes)
{
    if (now.isNull()) {
        throw core::ConfigurationError(QStringLiteral("slot search requires a current time"));
    }
    if (!day.isValid()) {
        throw core::ConfigurationError(QStringLiteral("slot search requires a valid day"));
    }
    if (durationMinutes <= 0) {
        throw core::ConfigurationError(QStringLiteral("slot duration must be positive, got %1").arg(durationMinutes));
    }
}

std::vector<core::Interval> intervalsOf(const std::vector<data::Booking> &bookings)
{
    std::vector<core::Interval> intervals;
    intervals.reserve(bookings.size());
    for (const data::Booking &booking : bookings) {
        intervals.push_back(booking.interval);
    }
    return intervals;
}
} // namespace

core::TimePoint searchStart(const core::TimePoint &now, const QDate &day, const core::BusinessWindow &window)
{
    const core::TimePoint open = window.openOn(day);
    if (now.date() != day) {
        return open;
    }
    // Ceiling on the minute component; seconds are dropped and the carry
    // flows into the hour.
    const int granularity = window.granularityMinutes();
    const int roundedMinute = (now.minute() + granularity - 1) / granularity * granularity;
    const core::TimePoint rounded = core::TimePoint(day, QTime(now.hour(), 0)).addMinutes(roundedMinute);
    return std::max(rounded, open);
}

std::vector<core::Interval> findNextSlots(const core::TimePoint &now,
                                          const QDate &day,
                                          const core::BusinessWindow &window,
                                          int durationMinutes,
                                          int maxResults,
                                          const std::vector<core::Interval> &existing)
{
    validateRequest(now, day, durationMinutes);
    if (maxResults < 0) {
        throw core::ConfigurationError(QStringLiteral("maximum slot count must not be negative, got %1").arg(maxResults));
    }

    std::vector<core::Interval> slots;
    if (day < now.date()) {
        qCDebug(lcEngine) << "no slots offered for past day" << day;
        return slots;
    }

    const core::TimePoint close = window.closeOn(day);
    core::TimePoint start = searchStart(now, day, window);
    while (static_cast<int>(slots.size()) < maxResults) {
        const core::TimePoint end = start.addMinutes(durationMinutes);
        if (end > close) {
            break;
        }
        const core::Interval candidate(start, end);
        if (!hasConflict(candidate, existing)) {
            slots.push_back(candidate);
        }
        start = start.addMinutes(window.granularityMinutes());
    }
    return slots;
}

std::vector<core::Interval> findNextSlots(const core::TimePoint &now,
                                          const QDate &day,
                                          const core::BusinessWindow &window,
                                          int durationMinutes,
                                          int maxResults,
                                          const std::vector<data::Booking> &existing)
{
    return findNextSlots(now, day, window, durationMinutes, maxResults, intervalsOf(existing));
}

std::vector<core::TimePoint> availableStartTimes(const core::TimePoint &now,
                                                 const QDate &day,
                                                 const core::BusinessWindow &window,
                                                 int durationMinutes,
                                                 const std::vector<data::Booking> &existing)
{
    validateRequest(now, day, durationMinutes);

    std::vector<core::TimePoint> starts;
    const core::TimePoint close = window.closeOn(day);
    for (core::TimePoint start = window.openOn(day); start.addMinutes(durationMinutes) <= close;
         start = start.addMinutes(window.granularityMinutes())) {
        const core::Interval candidate = core::Interval::ofMinutes(start, durationMinutes);
        if (candidate.end() <= now) {
            continue;
        }
        if (!hasConflict(candidate, existing)) {
            starts.push_back(start);
        }
    }
    return starts;
}

} // namespace engine
} // namespace roomboard
