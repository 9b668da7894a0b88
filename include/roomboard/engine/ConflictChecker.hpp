#pragma once

#include <optional>
#include <vector>

#include "roomboard/core/Interval.hpp"
#include "roomboard/data/Booking.hpp"

namespace roomboard {
namespace engine {

// Returns the earliest-starting existing interval that overlaps `proposed`
// (half-open: touching at a boundary is not a conflict). Ties on start keep
// input order. Callers pass one room-day.
std::optional<core::Interval> hasConflict(const core::Interval &proposed, const std::vector<core::Interval> &existing);
std::optional<core::Interval> hasConflict(const core::Interval &proposed, const std::vector<data::Booking> &existing);

// Same rule, returning the whole booking.
std::optional<data::Booking> findConflictingBooking(const core::Interval &proposed, const std::vector<data::Booking> &existing);

} // namespace engine
} // namespace roomboard
