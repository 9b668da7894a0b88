#pragma once

#include <QMetaType>
#include <QString>
#include <optional>

#include "roomboard/core/TimePoint.hpp"

namespace roomboard {
namespace engine {

enum class StatusKind {
    Maintenance,
    Inactive,
    NightRest,
    FullyBooked,
    Occupied,
    AvailableUntil,
    AvailableAllDay
};

struct StatusResult
{
    StatusKind kind = StatusKind::AvailableAllDay;
    QString label;
    // End of the busy block (occupied) or start of the next booking (available).
    std::optional<core::TimePoint> until;
    std::optional<double> progressFraction;
    std::optional<qint64> remainingSeconds;
    std::optional<qint64> minutesUntilNext;

    bool isUnavailable() const;
    bool isOccupied() const;
    bool isAvailable() const;
};

bool operator==(const StatusResult &lhs, const StatusResult &rhs);
bool operator!=(const StatusResult &lhs, const StatusResult &rhs);

QString statusKindToString(StatusKind kind);

} // namespace engine
} // namespace roomboard

Q_DECLARE_METATYPE(roomboard::engine::StatusResult)
