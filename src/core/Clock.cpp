#include "roomboard/core/Clock.hpp"

#include <QDateTime>

namespace roomboard {
namespace core {

TimePoint SystemClock::now() const
{
    const QDateTime current = QDateTime::currentDateTime();
    return TimePoint(current.date(), current.time());
}

FixedClock::FixedClock(const TimePoint &now)
    : m_now(now)
{
}

TimePoint FixedClock::now() const
{
    return m_now;
}

void FixedClock::setNow(const TimePoint &now)
{
    m_now = now;
}

void FixedClock::advanceSeconds(qint64 seconds)
{
    m_now = m_now.addSeconds(seconds);
}

} // namespace core
} // namespace roomboard
