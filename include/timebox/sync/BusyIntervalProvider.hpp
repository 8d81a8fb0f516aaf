#pragma once

#include <QDateTime>
#include <optional>
#include <vector>

#include "timebox/data/BusyInterval.hpp"

namespace timebox {
namespace sync {

class BusyIntervalProvider
{
public:
    virtual ~BusyIntervalProvider() = default;

    // nullopt when the provider could not be reached; an empty list means "nothing busy".
    virtual std::optional<std::vector<data::BusyInterval>> fetchBusyIntervals(const QDateTime &from,
                                                                             const QDateTime &to) = 0;
};

} // namespace sync
} // namespace timebox
