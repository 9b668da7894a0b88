#include "roomboard/engine/BlockMerger.hpp"

#include <algorithm>

#include "roomboard/core/Logging.hpp"

namespace roomboard {
namespace engine {

namespace {
std::vector<data::Booking> sortedByStart(std::vector<data::Booking> bookings)
{
    std::stable_sort(bookings.begin(), bookings.end(), [](const data::Booking &lhs, const data::Booking &rhs) {
        if (lhs.interval.start() != rhs.interval.start()) {
            return lhs.interval.start() < rhs.interval.start();
        }
        return lhs.interval.end() < rhs.interval.end();
    });
    return bookings;
}

bool sameBooking(const data::Booking &lhs, const data::Booking &rhs)
{
    if (lhs.id != 0 || rhs.id != 0) {
        return lhs.id == rhs.id;
    }
    return lhs.interval == rhs.interval;
}
} // namespace

std::vector<Block> mergeBlocks(const std::vector<data::Booking> &bookings)
{
    std::vector<Block> blocks;
    for (const data::Booking &booking : sortedByStart(bookings)) {
        const core::Interval &interval = booking.interval;
        if (blocks.empty() || interval.start() > blocks.back().end) {
            blocks.push_back(Block{interval.start(), interval.end(), {booking.id}});
            continue;
        }
        Block &current = blocks.back();
        if (interval.start() < current.end) {
            // Upstream validation should have rejected this; absorb it so the
            // blocks stay disjoint.
            qCWarning(lcEngine) << "overlapping booking" << booking.id << interval.toString()
                                << "absorbed into block ending" << current.end.toString();
        }
        current.end = std::max(current.end, interval.end());
        current.bookingIds.push_back(booking.id);
    }
    return blocks;
}

std::vector<data::Booking> blockContaining(const data::Booking &booking, const std::vector<data::Booking> &bookings)
{
    std::vector<data::Booking> all = bookings;
    const bool present = std::any_of(all.begin(), all.end(), [&booking](const data::Booking &candidate) {
        return sameBooking(candidate, booking);
    });
    if (!present) {
        all.push_back(booking);
    }

    std::vector<data::Booking> chain;
    for (const Block &block : mergeBlocks(all)) {
        if (block.start > booking.interval.start() || block.end < booking.interval.end()) {
            continue;
        }
        for (const data::Booking &candidate : sortedByStart(all)) {
            if (candidate.interval.start() >= block.start && candidate.interval.end() <= block.end) {
                chain.push_back(candidate);
            }
        }
        break;
    }
    return chain;
}

} // namespace engine
} // namespace roomboard
