#pragma once

#include <QDate>
#include <optional>
#include <vector>

#include "roomboard/data/Booking.hpp"

namespace roomboard {
namespace data {

class BookingRepository
{
public:
    virtual ~BookingRepository() = default;

    // Bookings of one room that intersect the given day, ordered by start.
    virtual std::vector<Booking> fetchBookings(int roomId, const QDate &day) const = 0;
    virtual std::optional<Booking> findById(qint64 id) const = 0;
    // Rejects a booking that overlaps another booking of the same room.
    virtual std::optional<Booking> addBooking(Booking booking) = 0;
    virtual bool updateBooking(const Booking &booking) = 0;
    virtual bool removeBooking(qint64 id) = 0;
};

} // namespace data
} // namespace roomboard
