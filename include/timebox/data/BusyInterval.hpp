#pragma once

#include <QDateTime>

namespace timebox {
namespace data {

// Externally owned occupied range. Either endpoint may be missing (invalid QDateTime).
struct BusyInterval
{
    QDateTime start;
    QDateTime end;

    bool isComplete() const { return start.isValid() && end.isValid(); }
};

} // namespace data
} // namespace timebox
