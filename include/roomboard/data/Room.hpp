#pragma once

#include <QString>
#include <optional>

#include "roomboard/core/BusinessWindow.hpp"

namespace roomboard {
namespace data {

// Configured state that takes a room out of service regardless of bookings.
enum class SpecialState {
    None,
    Maintenance,
    Inactive,
    NightRest
};

SpecialState specialStateFromString(const QString &value);
QString specialStateToString(SpecialState state);

struct RoomConfig
{
    int id = 0;
    QString name;
    int capacity = 0;
    SpecialState specialState = SpecialState::None;
    // Overrides the configured opening hours for this room only.
    std::optional<core::BusinessWindow> window;
};

} // namespace data
} // namespace roomboard
