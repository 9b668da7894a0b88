#pragma once

#include <vector>

#include "roomboard/core/Interval.hpp"
#include "roomboard/data/Booking.hpp"

namespace roomboard {
namespace engine {

// A maximal run of touching bookings, treated as one continuous busy span.
struct Block
{
    core::TimePoint start;
    core::TimePoint end;
    std::vector<qint64> bookingIds;

    core::Interval interval() const { return core::Interval(start, end); }
};

// Output is ordered by start and mutually non-overlapping.
std::vector<Block> mergeBlocks(const std::vector<data::Booking> &bookings);

// The bookings forming the block that contains `booking`, ordered by start.
// `booking` itself is part of the result even if missing from `bookings`.
std::vector<data::Booking> blockContaining(const data::Booking &booking, const std::vector<data::Booking> &bookings);

} // namespace engine
} // namespace roomboard
