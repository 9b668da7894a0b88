#pragma once

#include "roomboard/core/TimePoint.hpp"

namespace roomboard {
namespace core {

// Supplies "now" to the layers that own a timer. Engine functions never
// consult a clock; they take the instant as a parameter.
class Clock
{
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

// Local wall-clock reading, taken as naive components.
class SystemClock : public Clock
{
public:
    TimePoint now() const override;
};

class FixedClock : public Clock
{
public:
    explicit FixedClock(const TimePoint &now);

    TimePoint now() const override;
    void setNow(const TimePoint &now);
    void advanceSeconds(qint64 seconds);

private:
    TimePoint m_now;
};

} // namespace core
} // namespace roomboard
