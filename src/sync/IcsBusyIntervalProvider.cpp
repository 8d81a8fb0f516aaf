#include "timebox/sync/IcsBusyIntervalProvider.hpp"

#include <QFile>

#include "timebox/core/Logging.hpp"
#include "timebox/data/IcsFormat.hpp"

namespace timebox {
namespace sync {

IcsBusyIntervalProvider::IcsBusyIntervalProvider(QString filePath)
    : m_filePath(std::move(filePath))
{
}

std::optional<std::vector<data::BusyInterval>> IcsBusyIntervalProvider::fetchBusyIntervals(const QDateTime &from,
                                                                                          const QDateTime &to)
{
    std::vector<data::BusyInterval> intervals;
    if (m_filePath.isEmpty()) {
        return intervals;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcSync) << "Cannot read busy calendar" << m_filePath << file.errorString();
        return std::nullopt;
    }

    bool inEvent = false;
    bool free = false;
    data::BusyInterval current;
    const QStringList lines = data::ics::readUnfoldedLines(file);
    for (const QString &line : lines) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            inEvent = true;
            free = false;
            current = data::BusyInterval{};
            continue;
        }
        if (line == QLatin1String("END:VEVENT")) {
            inEvent = false;
            if (free) {
                continue;
            }
            // Incomplete intervals are passed on; the engine ignores them.
            if (current.isComplete() && (current.end <= from || current.start >= to)) {
                continue;
            }
            intervals.push_back(current);
            continue;
        }
        if (!inEvent) {
            continue;
        }

        data::IcsProperty property;
        if (!data::ics::parseProperty(line, property)) {
            continue;
        }
        if (property.name == QLatin1String("DTSTART")) {
            current.start = data::ics::parseDateTime(property.rawValue, property.parameters);
        } else if (property.name == QLatin1String("DTEND")) {
            current.end = data::ics::parseDateTime(property.rawValue, property.parameters);
        } else if (property.name == QLatin1String("TRANSP")) {
            free = free || property.rawValue.compare(QLatin1String("TRANSPARENT"), Qt::CaseInsensitive) == 0;
        } else if (property.name == QLatin1String("STATUS")) {
            free = free || property.rawValue.compare(QLatin1String("CANCELLED"), Qt::CaseInsensitive) == 0;
        }
    }

    qCInfo(lcSync) << "Fetched" << intervals.size() << "busy intervals from" << m_filePath;
    return intervals;
}

} // namespace sync
} // namespace timebox
