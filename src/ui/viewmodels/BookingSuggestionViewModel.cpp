#include "roomboard/ui/viewmodels/BookingSuggestionViewModel.hpp"

#include <algorithm>

#include "roomboard/core/ConfigurationError.hpp"
#include "roomboard/core/Logging.hpp"
#include "roomboard/data/BookingRepository.hpp"
#include "roomboard/engine/ConflictChecker.hpp"
#include "roomboard/engine/SlotFinder.hpp"

namespace roomboard {
namespace ui {

BookingSuggestionViewModel::BookingSuggestionViewModel(data::BookingRepository &repository,
                                                       data::RoomConfig room,
                                                       core::Settings settings,
                                                       QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_room(std::move(room))
    , m_settings(std::move(settings))
    , m_durationMinutes(m_settings.windowFor(m_room.window).defaultDurationMinutes())
{
}

void BookingSuggestionViewModel::setDay(const core::TimePoint &now, const QDate &day)
{
    if (now.isNull() || !day.isValid()) {
        return;
    }
    m_now = now;
    m_day = day;
    recompute();
}

void BookingSuggestionViewModel::setDurationMinutes(int minutes)
{
    if (minutes <= 0) {
        throw core::ConfigurationError(QStringLiteral("booking duration must be positive, got %1").arg(minutes));
    }
    if (minutes == m_durationMinutes) {
        return;
    }
    m_durationMinutes = minutes;
    recompute();
}

bool BookingSuggestionViewModel::selectSlot(int index)
{
    if (index < 0 || index >= static_cast<int>(m_suggestions.size())) {
        return false;
    }
    m_selectedIndex = index;
    m_proposed = m_suggestions[static_cast<std::size_t>(index)];
    checkConflict();
    return true;
}

void BookingSuggestionViewModel::setProposed(const core::Interval &proposed)
{
    m_selectedIndex.reset();
    m_proposed = proposed;
    checkConflict();
}

const QDate &BookingSuggestionViewModel::day() const
{
    return m_day;
}

int BookingSuggestionViewModel::durationMinutes() const
{
    return m_durationMinutes;
}

const std::vector<core::Interval> &BookingSuggestionViewModel::suggestions() const
{
    return m_suggestions;
}

std::optional<int> BookingSuggestionViewModel::selectedIndex() const
{
    return m_selectedIndex;
}

const std::optional<core::Interval> &BookingSuggestionViewModel::proposed() const
{
    return m_proposed;
}

const std::optional<data::Booking> &BookingSuggestionViewModel::conflict() const
{
    return m_conflict;
}

const std::vector<core::TimePoint> &BookingSuggestionViewModel::availableStartTimes() const
{
    return m_availableStartTimes;
}

void BookingSuggestionViewModel::recompute()
{
    if (m_now.isNull() || !m_day.isValid()) {
        return;
    }
    const core::BusinessWindow window = m_settings.windowFor(m_room.window);
    m_dayBookings = m_repository.fetchBookings(m_room.id, m_day);
    m_suggestions = engine::findNextSlots(m_now, m_day, window, m_durationMinutes, m_settings.maxSuggestions, m_dayBookings);
    m_availableStartTimes = engine::availableStartTimes(m_now, m_day, window, m_durationMinutes, m_dayBookings);
    // Suggestions start on the rounded current time, which need not lie on
    // the picker grid anchored at opening time.
    for (const core::Interval &slot : m_suggestions) {
        const auto pos = std::lower_bound(m_availableStartTimes.begin(), m_availableStartTimes.end(), slot.start());
        if (pos == m_availableStartTimes.end() || *pos != slot.start()) {
            m_availableStartTimes.insert(pos, slot.start());
        }
    }
    qCDebug(lcUi) << "room" << m_room.id << m_day << "suggestions:" << m_suggestions.size();

    m_selectedIndex.reset();
    emit suggestionsChanged(m_suggestions);
    if (!selectSlot(0)) {
        m_proposed.reset();
        checkConflict();
    }
}

void BookingSuggestionViewModel::checkConflict()
{
    const bool hadConflict = m_conflict.has_value();
    m_conflict.reset();
    if (m_proposed) {
        const QDate proposedDay = m_proposed->start().date();
        const std::vector<data::Booking> bookings = proposedDay == m_day
            ? m_dayBookings
            : m_repository.fetchBookings(m_room.id, proposedDay);
        m_conflict = engine::findConflictingBooking(*m_proposed, bookings);
    }
    if (hadConflict != m_conflict.has_value()) {
        emit conflictChanged(m_conflict.has_value());
    }
}

} // namespace ui
} // namespace roomboard
