#pragma once

#include <QString>

#include "roomboard/core/TimePoint.hpp"

namespace roomboard {
namespace core {

// Half-open span [start, end). start < end always holds; the constructor
// throws InvalidIntervalError otherwise.
class Interval
{
public:
    Interval(const TimePoint &start, const TimePoint &end);

    static Interval fromString(const QString &start, const QString &end);
    static Interval ofMinutes(const TimePoint &start, qint64 durationMinutes);

    const TimePoint &start() const { return m_start; }
    const TimePoint &end() const { return m_end; }

    qint64 durationSeconds() const;
    qint64 durationMinutes() const;

    bool contains(const TimePoint &point) const;
    bool contains(const Interval &other) const;
    bool overlaps(const Interval &other) const;
    bool touches(const Interval &other) const;

    QString toString() const;

    friend bool operator==(const Interval &lhs, const Interval &rhs) { return lhs.m_start == rhs.m_start && lhs.m_end == rhs.m_end; }
    friend bool operator!=(const Interval &lhs, const Interval &rhs) { return !(lhs == rhs); }

private:
    TimePoint m_start;
    TimePoint m_end;
};

} // namespace core
} // namespace roomboard
