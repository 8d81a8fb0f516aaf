#pragma once

#include <QHash>
#include <QString>

#include "timebox/sync/CalendarSync.hpp"

namespace timebox {
namespace sync {

// Publishes assignments as VEVENTs into an iCalendar file other calendars can subscribe to.
class IcsCalendarSync : public CalendarSync
{
public:
    explicit IcsCalendarSync(QString filePath);

    std::optional<QString> createEvent(const data::Assignment &assignment) override;
    bool deleteEvent(const QString &remoteEventId) override;

    int eventCount() const;

private:
    struct ExportedEvent
    {
        QString uid;
        QString summary;
        QString description;
        QDateTime start;
        QDateTime end;
    };

    void load();
    bool save() const;

    QString m_filePath;
    QHash<QString, ExportedEvent> m_events;
};

} // namespace sync
} // namespace timebox
