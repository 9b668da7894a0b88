#include "roomboard/ui/viewmodels/RoomStatusViewModel.hpp"

#include "roomboard/core/Logging.hpp"
#include "roomboard/data/BookingRepository.hpp"
#include "roomboard/engine/StatusEngine.hpp"

namespace roomboard {
namespace ui {

RoomStatusViewModel::RoomStatusViewModel(data::BookingRepository &repository,
                                         data::RoomConfig room,
                                         core::Settings settings,
                                         QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_room(std::move(room))
    , m_settings(std::move(settings))
{
}

void RoomStatusViewModel::setRoom(const data::RoomConfig &room)
{
    m_room = room;
    m_hasStatus = false;
}

void RoomStatusViewModel::refresh(const core::TimePoint &now)
{
    if (now.isNull()) {
        return;
    }
    const core::BusinessWindow window = m_settings.windowFor(m_room.window);
    m_bookingsToday = m_repository.fetchBookings(m_room.id, now.date());
    engine::StatusResult status = engine::computeStatus(now,
                                                        m_room.specialState,
                                                        m_bookingsToday,
                                                        window,
                                                        m_settings.thresholds);
    m_timeline.reset();
    if (!status.isUnavailable()) {
        m_timeline = engine::buildTimeline(now, m_bookingsToday);
    }

    if (m_hasStatus && status == m_status) {
        return;
    }
    qCDebug(lcUi) << "room" << m_room.id << "status" << engine::statusKindToString(status.kind) << status.label;
    m_status = std::move(status);
    m_hasStatus = true;
    emit statusChanged(m_status);
}

const data::RoomConfig &RoomStatusViewModel::room() const
{
    return m_room;
}

const engine::StatusResult &RoomStatusViewModel::status() const
{
    return m_status;
}

const std::optional<engine::LiveTimeline> &RoomStatusViewModel::timeline() const
{
    return m_timeline;
}

const std::vector<data::Booking> &RoomStatusViewModel::bookingsToday() const
{
    return m_bookingsToday;
}

bool RoomStatusViewModel::isInteractive() const
{
    return !m_status.isUnavailable();
}

} // namespace ui
} // namespace roomboard
