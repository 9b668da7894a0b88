#pragma once

#include <QObject>
#include <optional>
#include <vector>

#include "roomboard/core/Settings.hpp"
#include "roomboard/data/Booking.hpp"
#include "roomboard/data/Room.hpp"
#include "roomboard/engine/StatusResult.hpp"
#include "roomboard/engine/Timeline.hpp"

namespace roomboard {
namespace data {
class BookingRepository;
}

namespace ui {

// State behind one room card. The owner calls refresh() on its own tick.
class RoomStatusViewModel : public QObject
{
    Q_OBJECT

public:
    RoomStatusViewModel(data::BookingRepository &repository,
                        data::RoomConfig room,
                        core::Settings settings,
                        QObject *parent = nullptr);

    void setRoom(const data::RoomConfig &room);
    void refresh(const core::TimePoint &now);

    const data::RoomConfig &room() const;
    const engine::StatusResult &status() const;
    const std::optional<engine::LiveTimeline> &timeline() const;
    const std::vector<data::Booking> &bookingsToday() const;
    bool isInteractive() const;

signals:
    void statusChanged(const roomboard::engine::StatusResult &status);

private:
    data::BookingRepository &m_repository;
    data::RoomConfig m_room;
    core::Settings m_settings;
    std::vector<data::Booking> m_bookingsToday;
    engine::StatusResult m_status;
    std::optional<engine::LiveTimeline> m_timeline;
    bool m_hasStatus = false;
};

} // namespace ui
} // namespace roomboard
