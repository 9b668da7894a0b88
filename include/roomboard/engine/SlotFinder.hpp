#pragma once

#include <QDate>
#include <vector>

#include "roomboard/core/BusinessWindow.hpp"
#include "roomboard/core/Interval.hpp"
#include "roomboard/data/Booking.hpp"

namespace roomboard {
namespace engine {

// First candidate start for `day`: `now` rounded up to the granularity when
// `day` is today, the opening time for a later day. Never before opening.
core::TimePoint searchStart(const core::TimePoint &now, const QDate &day, const core::BusinessWindow &window);

// Up to `maxResults` conflict-free slots of `durationMinutes`, stepping by the
// window granularity. Consecutive results may overlap: they are alternatives,
// not a partition of the day. The first result is the default suggestion.
// A day before today yields no slots.
std::vector<core::Interval> findNextSlots(const core::TimePoint &now,
                                          const QDate &day,
                                          const core::BusinessWindow &window,
                                          int durationMinutes,
                                          int maxResults,
                                          const std::vector<core::Interval> &existing);
std::vector<core::Interval> findNextSlots(const core::TimePoint &now,
                                          const QDate &day,
                                          const core::BusinessWindow &window,
                                          int durationMinutes,
                                          int maxResults,
                                          const std::vector<data::Booking> &existing);

// Every grid start time of the day whose slot is free and has not already
// ended at `now`.
std::vector<core::TimePoint> availableStartTimes(const core::TimePoint &now,
                                                 const QDate &day,
                                                 const core::BusinessWindow &window,
                                                 int durationMinutes,
                                                 const std::vector<data::Booking> &existing);

} // namespace engine
} // namespace roomboard
