#include "roomboard/core/TimePoint.hpp"

#include <QRegularExpression>

#include "roomboard/core/ConfigurationError.hpp"

namespace roomboard {
namespace core {

namespace {
constexpr qint64 SECONDS_PER_DAY = 24 * 60 * 60;

qint64 floorDiv(qint64 value, qint64 divisor)
{
    qint64 quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

// Accepts the SQL form ("2025-11-13 14:30:00") and the ISO form with 'T'.
// Seconds are optional; a fraction and a zone suffix are tolerated but ignored.
const QRegularExpression &dateTimePattern()
{
    static const QRegularExpression pattern(QStringLiteral(
        R"(^\s*(\d{4})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.\d+)?)?(?:Z|[+-]\d{2}:?\d{2})?\s*$)"));
    return pattern;
}
} // namespace

TimePoint::TimePoint(int year, int month, int day, int hour, int minute, int second)
    : TimePoint(QDate(year, month, day), QTime(hour, minute, second))
{
}

TimePoint::TimePoint(const QDate &date, const QTime &time)
{
    if (!date.isValid() || !time.isValid()) {
        throw ConfigurationError(QStringLiteral("invalid date/time components: %1 %2")
                                     .arg(date.toString(Qt::ISODate), time.toString(Qt::ISODate)));
    }
    m_seconds = date.toJulianDay() * SECONDS_PER_DAY + time.msecsSinceStartOfDay() / 1000;
    m_valid = true;
}

TimePoint TimePoint::fromString(const QString &value)
{
    const auto parsed = tryParse(value);
    if (!parsed) {
        throw ConfigurationError(QStringLiteral("cannot parse naive date/time '%1'").arg(value));
    }
    return *parsed;
}

std::optional<TimePoint> TimePoint::tryParse(const QString &value)
{
    const QRegularExpressionMatch match = dateTimePattern().match(value);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const QDate date(match.captured(1).toInt(), match.captured(2).toInt(), match.captured(3).toInt());
    const int seconds = match.captured(6).isEmpty() ? 0 : match.captured(6).toInt();
    const QTime time(match.captured(4).toInt(), match.captured(5).toInt(), seconds);
    if (!date.isValid() || !time.isValid()) {
        return std::nullopt;
    }
    return TimePoint(date, time);
}

TimePoint TimePoint::fromSeconds(qint64 seconds)
{
    TimePoint result;
    result.m_seconds = seconds;
    result.m_valid = true;
    return result;
}

TimePoint TimePoint::atMinuteOfDay(const QDate &date, int minuteOfDay)
{
    if (!date.isValid()) {
        throw ConfigurationError(QStringLiteral("invalid date"));
    }
    if (minuteOfDay < 0 || minuteOfDay > 24 * 60) {
        throw ConfigurationError(QStringLiteral("minute of day out of range: %1").arg(minuteOfDay));
    }
    return fromSeconds(date.toJulianDay() * SECONDS_PER_DAY + static_cast<qint64>(minuteOfDay) * 60);
}

bool TimePoint::isNull() const
{
    return !m_valid;
}

QDate TimePoint::date() const
{
    if (!m_valid) {
        return {};
    }
    return QDate::fromJulianDay(floorDiv(m_seconds, SECONDS_PER_DAY));
}

QTime TimePoint::time() const
{
    if (!m_valid) {
        return {};
    }
    return QTime::fromMSecsSinceStartOfDay(secondOfDay() * 1000);
}

int TimePoint::hour() const
{
    return secondOfDay() / 3600;
}

int TimePoint::minute() const
{
    return (secondOfDay() / 60) % 60;
}

int TimePoint::second() const
{
    return secondOfDay() % 60;
}

int TimePoint::minuteOfDay() const
{
    return secondOfDay() / 60;
}

int TimePoint::secondOfDay() const
{
    return static_cast<int>(m_seconds - floorDiv(m_seconds, SECONDS_PER_DAY) * SECONDS_PER_DAY);
}

qint64 TimePoint::toSeconds() const
{
    return m_seconds;
}

TimePoint TimePoint::addSeconds(qint64 seconds) const
{
    if (!m_valid) {
        return {};
    }
    return fromSeconds(m_seconds + seconds);
}

TimePoint TimePoint::addMinutes(qint64 minutes) const
{
    return addSeconds(minutes * 60);
}

QString TimePoint::toString() const
{
    if (!m_valid) {
        return {};
    }
    return QStringLiteral("%1 %2").arg(date().toString(QStringLiteral("yyyy-MM-dd")),
                                       time().toString(QStringLiteral("HH:mm:ss")));
}

QString TimePoint::toHHMM() const
{
    if (!m_valid) {
        return {};
    }
    return time().toString(QStringLiteral("HH:mm"));
}

int compare(const TimePoint &a, const TimePoint &b)
{
    if (a < b) {
        return -1;
    }
    return b < a ? 1 : 0;
}

qint64 diffSeconds(const TimePoint &a, const TimePoint &b)
{
    return b.toSeconds() - a.toSeconds();
}

TimePoint addMinutes(const TimePoint &t, qint64 minutes)
{
    return t.addMinutes(minutes);
}

QString formatCountdown(qint64 seconds)
{
    if (seconds < 0) {
        seconds = 0;
    }
    const qint64 hours = seconds / 3600;
    const qint64 minutes = (seconds % 3600) / 60;
    const qint64 secs = seconds % 60;
    return QStringLiteral("%1:%2:%3")
        .arg(hours, 2, 10, QLatin1Char('0'))
        .arg(minutes, 2, 10, QLatin1Char('0'))
        .arg(secs, 2, 10, QLatin1Char('0'));
}

} // namespace core
} // namespace roomboard
