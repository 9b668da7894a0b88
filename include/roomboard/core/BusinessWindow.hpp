#pragma once

#include <QDate>
#include <QString>

#include "roomboard/core/Interval.hpp"
#include "roomboard/core/TimePoint.hpp"

namespace roomboard {
namespace core {

// Daily bounds within which bookings and suggestions are confined. Bounds
// are minutes from midnight; closeMinute may be 1440 (24:00).
class BusinessWindow
{
public:
    BusinessWindow();
    BusinessWindow(int openMinute, int closeMinute, int granularityMinutes = 15, int defaultDurationMinutes = 30);

    // 00:00-24:00, used when developer mode lifts the opening hours.
    static BusinessWindow allDay(int granularityMinutes = 15, int defaultDurationMinutes = 30);
    // "HH:mm"; "24:00" is accepted as the end of the day.
    static int parseMinuteOfDay(const QString &value);
    static QString formatMinuteOfDay(int minuteOfDay);

    int openMinute() const { return m_openMinute; }
    int closeMinute() const { return m_closeMinute; }
    int granularityMinutes() const { return m_granularityMinutes; }
    int defaultDurationMinutes() const { return m_defaultDurationMinutes; }
    int windowMinutes() const { return m_closeMinute - m_openMinute; }

    TimePoint openOn(const QDate &day) const;
    TimePoint closeOn(const QDate &day) const;
    Interval on(const QDate &day) const;
    bool contains(const Interval &interval, const QDate &day) const;

    QString toString() const;

    friend bool operator==(const BusinessWindow &lhs, const BusinessWindow &rhs)
    {
        return lhs.m_openMinute == rhs.m_openMinute && lhs.m_closeMinute == rhs.m_closeMinute
            && lhs.m_granularityMinutes == rhs.m_granularityMinutes
            && lhs.m_defaultDurationMinutes == rhs.m_defaultDurationMinutes;
    }
    friend bool operator!=(const BusinessWindow &lhs, const BusinessWindow &rhs) { return !(lhs == rhs); }

private:
    int m_openMinute = 8 * 60;
    int m_closeMinute = 20 * 60;
    int m_granularityMinutes = 15;
    int m_defaultDurationMinutes = 30;
};

// "Heavily booked" heuristic: either limit reached makes an occupied room
// report as fully booked.
struct LoadThresholds
{
    int bookingCount = 3;
    double bookedFraction = 0.66;
};

} // namespace core
} // namespace roomboard
