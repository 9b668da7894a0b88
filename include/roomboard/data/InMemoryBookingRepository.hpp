#pragma once

#include <map>

#include "roomboard/data/BookingRepository.hpp"

namespace roomboard {
namespace data {

class InMemoryBookingRepository : public BookingRepository
{
public:
    InMemoryBookingRepository();
    ~InMemoryBookingRepository() override;

    std::vector<Booking> fetchBookings(int roomId, const QDate &day) const override;
    std::optional<Booking> findById(qint64 id) const override;
    std::optional<Booking> addBooking(Booking booking) override;
    bool updateBooking(const Booking &booking) override;
    bool removeBooking(qint64 id) override;

private:
    bool overlapsExisting(const Booking &booking) const;

    std::map<qint64, Booking> m_bookings;
    qint64 m_nextId = 1;
};

} // namespace data
} // namespace roomboard
