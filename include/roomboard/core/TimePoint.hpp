#pragma once

#include <QDate>
#include <QString>
#include <QTime>
#include <QtGlobal>
#include <optional>

namespace roomboard {
namespace core {

// Timezone-naive instant. The components are stored as an absolute second
// count derived from the Julian day, so no offset or DST rule ever applies:
// "2025-11-13 14:30:00" means exactly that wall-clock reading.
class TimePoint
{
public:
    TimePoint() = default;
    TimePoint(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
    TimePoint(const QDate &date, const QTime &time);

    static TimePoint fromString(const QString &value);
    static std::optional<TimePoint> tryParse(const QString &value);
    static TimePoint fromSeconds(qint64 seconds);
    // minuteOfDay may be 1440, meaning midnight of the following day.
    static TimePoint atMinuteOfDay(const QDate &date, int minuteOfDay);

    bool isNull() const;

    QDate date() const;
    QTime time() const;
    int hour() const;
    int minute() const;
    int second() const;
    int minuteOfDay() const;
    int secondOfDay() const;

    qint64 toSeconds() const;
    TimePoint addSeconds(qint64 seconds) const;
    TimePoint addMinutes(qint64 minutes) const;

    QString toString() const;
    QString toHHMM() const;

    friend bool operator==(const TimePoint &lhs, const TimePoint &rhs) { return lhs.m_seconds == rhs.m_seconds && lhs.m_valid == rhs.m_valid; }
    friend bool operator!=(const TimePoint &lhs, const TimePoint &rhs) { return !(lhs == rhs); }
    friend bool operator<(const TimePoint &lhs, const TimePoint &rhs) { return lhs.m_seconds < rhs.m_seconds; }
    friend bool operator>(const TimePoint &lhs, const TimePoint &rhs) { return rhs < lhs; }
    friend bool operator<=(const TimePoint &lhs, const TimePoint &rhs) { return !(rhs < lhs); }
    friend bool operator>=(const TimePoint &lhs, const TimePoint &rhs) { return !(lhs < rhs); }

private:
    qint64 m_seconds = 0;
    bool m_valid = false;
};

int compare(const TimePoint &a, const TimePoint &b);
// Positive when b is after a.
qint64 diffSeconds(const TimePoint &a, const TimePoint &b);
TimePoint addMinutes(const TimePoint &t, qint64 minutes);

// "HH:MM:SS"; negative input renders as 00:00:00.
QString formatCountdown(qint64 seconds);

} // namespace core
} // namespace roomboard
