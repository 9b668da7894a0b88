#pragma once

#include <QString>
#include <QtGlobal>

#include "roomboard/core/Interval.hpp"

namespace roomboard {
namespace data {

struct Booking
{
    qint64 id = 0;
    int roomId = 0;
    core::Interval interval;
    QString title;
    QString ownerRef;
    QString comment;
};

} // namespace data
} // namespace roomboard
