#include "roomboard/core/Interval.hpp"

#include "roomboard/core/ConfigurationError.hpp"

namespace roomboard {
namespace core {

Interval::Interval(const TimePoint &start, const TimePoint &end)
    : m_start(start)
    , m_end(end)
{
    if (start.isNull() || end.isNull()) {
        throw InvalidIntervalError(QStringLiteral("interval endpoints must be set"));
    }
    if (!(start < end)) {
        throw InvalidIntervalError(QStringLiteral("interval start %1 is not before end %2")
                                       .arg(start.toString(), end.toString()));
    }
}

Interval Interval::fromString(const QString &start, const QString &end)
{
    return Interval(TimePoint::fromString(start), TimePoint::fromString(end));
}

Interval Interval::ofMinutes(const TimePoint &start, qint64 durationMinutes)
{
    return Interval(start, start.addMinutes(durationMinutes));
}

qint64 Interval::durationSeconds() const
{
    return diffSeconds(m_start, m_end);
}

qint64 Interval::durationMinutes() const
{
    return durationSeconds() / 60;
}

bool Interval::contains(const TimePoint &point) const
{
    return m_start <= point && point < m_end;
}

bool Interval::contains(const Interval &other) const
{
    return m_start <= other.m_start && other.m_end <= m_end;
}

bool Interval::overlaps(const Interval &other) const
{
    return m_start < other.m_end && m_end > other.m_start;
}

bool Interval::touches(const Interval &other) const
{
    return m_end == other.m_start || other.m_end == m_start;
}

QString Interval::toString() const
{
    return QStringLiteral("%1/%2").arg(m_start.toString(), m_end.toString());
}

} // namespace core
} // namespace roomboard
