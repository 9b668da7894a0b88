#include "roomboard/engine/StatusResult.hpp"

namespace roomboard {
namespace engine {

bool StatusResult::isUnavailable() const
{
    return kind == StatusKind::Maintenance || kind == StatusKind::Inactive || kind == StatusKind::NightRest;
}

bool StatusResult::isOccupied() const
{
    return kind == StatusKind::Occupied || kind == StatusKind::FullyBooked;
}

bool StatusResult::isAvailable() const
{
    return kind == StatusKind::AvailableUntil || kind == StatusKind::AvailableAllDay;
}

bool operator==(const StatusResult &lhs, const StatusResult &rhs)
{
    return lhs.kind == rhs.kind && lhs.label == rhs.label && lhs.until == rhs.until
        && lhs.progressFraction == rhs.progressFraction && lhs.remainingSeconds == rhs.remainingSeconds
        && lhs.minutesUntilNext == rhs.minutesUntilNext;
}

bool operator!=(const StatusResult &lhs, const StatusResult &rhs)
{
    return !(lhs == rhs);
}

QString statusKindToString(StatusKind kind)
{
    switch (kind) {
    case StatusKind::Maintenance:
        return QStringLiteral("maintenance");
    case StatusKind::Inactive:
        return QStringLiteral("inactive");
    case StatusKind::NightRest:
        return QStringLiteral("night-rest");
    case StatusKind::FullyBooked:
        return QStringLiteral("fully-booked");
    case StatusKind::Occupied:
        return QStringLiteral("occupied");
    case StatusKind::AvailableUntil:
        return QStringLiteral("available-until");
    case StatusKind::AvailableAllDay:
        return QStringLiteral("available");
    }
    return QString();
}

} // namespace engine
} // namespace roomboard
