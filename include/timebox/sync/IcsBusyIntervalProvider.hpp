#pragma once

#include <QString>

#include "timebox/sync/BusyIntervalProvider.hpp"

namespace timebox {
namespace sync {

/**
 * Reads busy time from an iCalendar export of the user's external calendar.
 * Cancelled and transparent events are not busy. The file is never written.
 */
class IcsBusyIntervalProvider : public BusyIntervalProvider
{
public:
    explicit IcsBusyIntervalProvider(QString filePath);

    std::optional<std::vector<data::BusyInterval>> fetchBusyIntervals(const QDateTime &from,
                                                                     const QDateTime &to) override;

private:
    QString m_filePath;
};

} // namespace sync
} // namespace timebox
