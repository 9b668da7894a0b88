#include "roomboard/engine/ConflictChecker.hpp"

namespace roomboard {
namespace engine {

namespace {
const core::Interval &intervalOf(const core::Interval &interval)
{
    return interval;
}

const core::Interval &intervalOf(const data::Booking &booking)
{
    return booking.interval;
}

template<typename T>
const T *earliestOverlap(const core::Interval &proposed, const std::vector<T> &existing)
{
    const T *best = nullptr;
    for (const T &entry : existing) {
        const core::Interval &interval = intervalOf(entry);
        if (!proposed.overlaps(interval)) {
            continue;
        }
        if (!best || interval.start() < intervalOf(*best).start()) {
            best = &entry;
        }
    }
    return best;
}
} // namespace

std::optional<core::Interval> hasConflict(const core::Interval &proposed, const std::vector<core::Interval> &existing)
{
    if (const core::Interval *conflict = earliestOverlap(proposed, existing)) {
        return *conflict;
    }
    return std::nullopt;
}

std::optional<core::Interval> hasConflict(const core::Interval &proposed, const std::vector<data::Booking> &existing)
{
    if (const data::Booking *conflict = earliestOverlap(proposed, existing)) {
        return conflict->interval;
    }
    return std::nullopt;
}

std::optional<data::Booking> findConflictingBooking(const core::Interval &proposed, const std::vector<data::Booking> &existing)
{
    if (const data::Booking *conflict = earliestOverlap(proposed, existing)) {
        return *conflict;
    }
    return std::nullopt;
}

} // namespace engine
} // namespace roomboard
