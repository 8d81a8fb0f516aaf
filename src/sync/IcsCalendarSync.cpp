#include "timebox/sync/IcsCalendarSync.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>
#include <QUuid>
#include <algorithm>

#include "timebox/core/Logging.hpp"
#include "timebox/data/IcsFormat.hpp"

namespace timebox {
namespace sync {

IcsCalendarSync::IcsCalendarSync(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

std::optional<QString> IcsCalendarSync::createEvent(const data::Assignment &assignment)
{
    if (!assignment.start.isValid() || !assignment.end.isValid()) {
        return std::nullopt;
    }

    ExportedEvent event;
    event.uid = QUuid::createUuid().toString(QUuid::WithoutBraces) + QStringLiteral("@timebox");
    event.summary = sessionTitle(assignment);
    event.description = sessionDescription(assignment);
    event.start = assignment.start;
    event.end = assignment.end;

    m_events.insert(event.uid, event);
    if (!save()) {
        m_events.remove(event.uid);
        return std::nullopt;
    }
    return event.uid;
}

bool IcsCalendarSync::deleteEvent(const QString &remoteEventId)
{
    if (!m_events.contains(remoteEventId)) {
        qCWarning(lcSync) << "Unknown exported event" << remoteEventId;
        return false;
    }
    const ExportedEvent removed = m_events.take(remoteEventId);
    if (!save()) {
        m_events.insert(removed.uid, removed);
        return false;
    }
    return true;
}

int IcsCalendarSync::eventCount() const
{
    return m_events.size();
}

void IcsCalendarSync::load()
{
    m_events.clear();
    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcSync) << "Cannot read" << m_filePath << file.errorString();
        return;
    }

    bool inEvent = false;
    ExportedEvent current;
    const QStringList lines = data::ics::readUnfoldedLines(file);
    for (const QString &line : lines) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            inEvent = true;
            current = ExportedEvent{};
            continue;
        }
        if (line == QLatin1String("END:VEVENT")) {
            inEvent = false;
            if (!current.uid.isEmpty()) {
                m_events.insert(current.uid, current);
            }
            continue;
        }
        if (!inEvent) {
            continue;
        }
        data::IcsProperty property;
        if (!data::ics::parseProperty(line, property)) {
            continue;
        }
        if (property.name == QLatin1String("UID")) {
            current.uid = property.value;
        } else if (property.name == QLatin1String("SUMMARY")) {
            current.summary = property.value;
        } else if (property.name == QLatin1String("DESCRIPTION")) {
            current.description = property.value;
        } else if (property.name == QLatin1String("DTSTART")) {
            current.start = data::ics::parseDateTime(property.rawValue, property.parameters);
        } else if (property.name == QLatin1String("DTEND")) {
            current.end = data::ics::parseDateTime(property.rawValue, property.parameters);
        }
    }
}

bool IcsCalendarSync::save() const
{
    if (m_filePath.isEmpty()) {
        return false;
    }
    const QDir dir = QFileInfo(m_filePath).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcSync) << "Cannot write" << m_filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Timebox//Sessions//EN\n";

    auto events = m_events.values();
    std::sort(events.begin(), events.end(), [](const ExportedEvent &lhs, const ExportedEvent &rhs) {
        return lhs.start < rhs.start;
    });
    const QString stamp = data::ics::formatDateTime(QDateTime::currentDateTimeUtc());
    for (const ExportedEvent &event : events) {
        stream << "BEGIN:VEVENT\n";
        stream << "UID:" << data::ics::encodeText(event.uid) << '\n';
        stream << "DTSTAMP:" << stamp << '\n';
        stream << "SUMMARY:" << data::ics::encodeText(event.summary) << '\n';
        stream << "DESCRIPTION:" << data::ics::encodeText(event.description) << '\n';
        stream << "DTSTART:" << data::ics::formatDateTime(event.start) << '\n';
        stream << "DTEND:" << data::ics::formatDateTime(event.end) << '\n';
        stream << "END:VEVENT\n";
    }
    stream << "END:VCALENDAR\n";

    stream.flush();
    if (stream.status() != QTextStream::Ok) {
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

} // namespace sync
} // namespace timebox
