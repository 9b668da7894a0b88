#include "roomboard/core/BusinessWindow.hpp"

#include <QStringList>

#include "roomboard/core/ConfigurationError.hpp"

namespace roomboard {
namespace core {

namespace {
constexpr int MINUTES_PER_DAY = 24 * 60;
}

BusinessWindow::BusinessWindow() = default;

BusinessWindow::BusinessWindow(int openMinute, int closeMinute, int granularityMinutes, int defaultDurationMinutes)
    : m_openMinute(openMinute)
    , m_closeMinute(closeMinute)
    , m_granularityMinutes(granularityMinutes)
    , m_defaultDurationMinutes(defaultDurationMinutes)
{
    if (openMinute < 0 || closeMinute > MINUTES_PER_DAY || openMinute >= closeMinute) {
        throw ConfigurationError(QStringLiteral("business window %1-%2 is not a valid range within one day")
                                     .arg(formatMinuteOfDay(openMinute), formatMinuteOfDay(closeMinute)));
    }
    if (granularityMinutes <= 0 || granularityMinutes > closeMinute - openMinute) {
        throw ConfigurationError(QStringLiteral("granularity must be between 1 and %1 minutes, got %2")
                                     .arg(closeMinute - openMinute)
                                     .arg(granularityMinutes));
    }
    if (defaultDurationMinutes <= 0) {
        throw ConfigurationError(QStringLiteral("default duration must be positive, got %1").arg(defaultDurationMinutes));
    }
}

BusinessWindow BusinessWindow::allDay(int granularityMinutes, int defaultDurationMinutes)
{
    return BusinessWindow(0, MINUTES_PER_DAY, granularityMinutes, defaultDurationMinutes);
}

int BusinessWindow::parseMinuteOfDay(const QString &value)
{
    const QStringList parts = value.trimmed().split(QLatin1Char(':'));
    if (parts.size() != 2) {
        throw ConfigurationError(QStringLiteral("expected HH:mm, got '%1'").arg(value));
    }
    bool hourOk = false;
    bool minuteOk = false;
    const int hour = parts.at(0).toInt(&hourOk);
    const int minute = parts.at(1).toInt(&minuteOk);
    if (!hourOk || !minuteOk || hour < 0 || minute < 0 || minute > 59) {
        throw ConfigurationError(QStringLiteral("expected HH:mm, got '%1'").arg(value));
    }
    const int total = hour * 60 + minute;
    if (total > MINUTES_PER_DAY) {
        throw ConfigurationError(QStringLiteral("time of day past 24:00: '%1'").arg(value));
    }
    return total;
}

QString BusinessWindow::formatMinuteOfDay(int minuteOfDay)
{
    return QStringLiteral("%1:%2")
        .arg(minuteOfDay / 60, 2, 10, QLatin1Char('0'))
        .arg(minuteOfDay % 60, 2, 10, QLatin1Char('0'));
}

TimePoint BusinessWindow::openOn(const QDate &day) const
{
    return TimePoint::atMinuteOfDay(day, m_openMinute);
}

TimePoint BusinessWindow::closeOn(const QDate &day) const
{
    return TimePoint::atMinuteOfDay(day, m_closeMinute);
}

Interval BusinessWindow::on(const QDate &day) const
{
    return Interval(openOn(day), closeOn(day));
}

bool BusinessWindow::contains(const Interval &interval, const QDate &day) const
{
    return on(day).contains(interval);
}

QString BusinessWindow::toString() const
{
    return QStringLiteral("%1-%2").arg(formatMinuteOfDay(m_openMinute), formatMinuteOfDay(m_closeMinute));
}

} // namespace core
} // namespace roomboard
