#include "roomboard/data/InMemoryBookingRepository.hpp"

#include <algorithm>

#include "roomboard/core/Logging.hpp"

namespace roomboard {
namespace data {

InMemoryBookingRepository::InMemoryBookingRepository() = default;
InMemoryBookingRepository::~InMemoryBookingRepository() = default;

std::vector<Booking> InMemoryBookingRepository::fetchBookings(int roomId, const QDate &day) const
{
    std::vector<Booking> bookings;
    if (!day.isValid()) {
        return bookings;
    }
    const core::Interval wholeDay(core::TimePoint::atMinuteOfDay(day, 0), core::TimePoint::atMinuteOfDay(day, 24 * 60));
    for (const auto &entry : m_bookings) {
        const Booking &booking = entry.second;
        if (booking.roomId != roomId || !booking.interval.overlaps(wholeDay)) {
            continue;
        }
        bookings.push_back(booking);
    }
    std::sort(bookings.begin(), bookings.end(), [](const Booking &lhs, const Booking &rhs) {
        return lhs.interval.start() < rhs.interval.start();
    });
    return bookings;
}

std::optional<Booking> InMemoryBookingRepository::findById(qint64 id) const
{
    const auto it = m_bookings.find(id);
    if (it != m_bookings.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Booking> InMemoryBookingRepository::addBooking(Booking booking)
{
    if (booking.id <= 0) {
        booking.id = m_nextId;
    }
    if (m_bookings.count(booking.id) > 0) {
        qCWarning(lcData) << "booking id already taken:" << booking.id;
        return std::nullopt;
    }
    if (overlapsExisting(booking)) {
        qCInfo(lcData) << "rejected overlapping booking for room" << booking.roomId << booking.interval.toString();
        return std::nullopt;
    }
    m_nextId = std::max(m_nextId, booking.id + 1);
    m_bookings.emplace(booking.id, booking);
    return booking;
}

bool InMemoryBookingRepository::updateBooking(const Booking &booking)
{
    const auto it = m_bookings.find(booking.id);
    if (it == m_bookings.end()) {
        return false;
    }
    if (overlapsExisting(booking)) {
        qCInfo(lcData) << "rejected overlapping update of booking" << booking.id;
        return false;
    }
    it->second = booking;
    return true;
}

bool InMemoryBookingRepository::removeBooking(qint64 id)
{
    return m_bookings.erase(id) > 0;
}

bool InMemoryBookingRepository::overlapsExisting(const Booking &booking) const
{
    return std::any_of(m_bookings.begin(), m_bookings.end(), [&booking](const auto &entry) {
        const Booking &other = entry.second;
        return other.id != booking.id && other.roomId == booking.roomId && other.interval.overlaps(booking.interval);
    });
}

} // namespace data
} // namespace roomboard
