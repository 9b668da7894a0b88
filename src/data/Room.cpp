#include "roomboard/data/Room.hpp"

#include "roomboard/core/ConfigurationError.hpp"

namespace roomboard {
namespace data {

SpecialState specialStateFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower().replace(QLatin1Char('-'), QLatin1Char('_'));
    if (normalized.isEmpty() || normalized == QLatin1String("none") || normalized == QLatin1String("active")
        || normalized == QLatin1String("available")) {
        return SpecialState::None;
    }
    if (normalized == QLatin1String("maintenance")) {
        return SpecialState::Maintenance;
    }
    if (normalized == QLatin1String("inactive")) {
        return SpecialState::Inactive;
    }
    if (normalized == QLatin1String("night_rest")) {
        return SpecialState::NightRest;
    }
    throw core::ConfigurationError(QStringLiteral("unknown room state '%1'").arg(value));
}

QString specialStateToString(SpecialState state)
{
    switch (state) {
    case SpecialState::Maintenance:
        return QStringLiteral("maintenance");
    case SpecialState::Inactive:
        return QStringLiteral("inactive");
    case SpecialState::NightRest:
        return QStringLiteral("night_rest");
    case SpecialState::None:
        break;
    }
    return QStringLiteral("none");
}

} // namespace data
} // namespace roomboard
