#include "timebox/data/IcsFormat.hpp"

#include <QIODevice>
#include <QTextStream>
#include <QTimeZone>
#include <algorithm>

namespace timebox {
namespace data {
namespace ics {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr auto LOCAL_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";

const QStringList &dayCodes()
{
    static const QStringList codes = { QStringLiteral("SU"), QStringLiteral("MO"), QStringLiteral("TU"),
                                       QStringLiteral("WE"), QStringLiteral("TH"), QStringLiteral("FR"),
                                       QStringLiteral("SA") };
    return codes;
}
} // namespace

QStringList readUnfoldedLines(QIODevice &device)
{
    QTextStream stream(&device);
    stream.setCodec("UTF-8");

    QStringList lines;
    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                lines << accumulator;
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        lines << accumulator;
    }
    return lines;
}

bool parseProperty(const QString &line, IcsProperty &property)
{
    const int colonIndex = line.indexOf(':');
    if (colonIndex <= 0) {
        return false;
    }
    const QString head = line.left(colonIndex);
    property.name = head.section(';', 0, 0).toUpper();
    property.parameters = head.contains(';') ? head.section(';', 1) : QString();
    property.rawValue = line.mid(colonIndex + 1);
    property.value = decodeText(property.rawValue);
    return true;
}

QString encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c != '\\' || i + 1 == text.size()) {
            decoded += c;
            continue;
        }
        const QChar next = text.at(++i);
        if (next == 'n' || next == 'N') {
            decoded += '\n';
        } else {
            decoded += next;
        }
    }
    return decoded;
}

QString formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(QLatin1String(DATE_TIME_FORMAT));
}

QDateTime parseDateTime(const QString &value, const QString &parameters)
{
    if (value.length() == 8) {
        const QDate date = QDate::fromString(value, DATE_FORMAT);
        return date.isValid() ? date.startOfDay() : QDateTime();
    }
    if (value.endsWith('Z')) {
        QDateTime dt = QDateTime::fromString(value, DATE_TIME_FORMAT);
        dt.setTimeSpec(Qt::UTC);
        return dt;
    }
    QDateTime dt = QDateTime::fromString(value, LOCAL_DATE_TIME_FORMAT);
    if (!dt.isValid()) {
        return QDateTime::fromString(value, Qt::ISODate);
    }
    const int tzIndex = parameters.indexOf(QLatin1String("TZID="), 0, Qt::CaseInsensitive);
    if (tzIndex >= 0) {
        const QString tzId = parameters.mid(tzIndex + 5).section(';', 0, 0);
        const QTimeZone zone(tzId.toUtf8());
        if (zone.isValid()) {
            dt.setTimeZone(zone);
        }
    }
    return dt;
}

QString formatUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    const QString withBraces = QStringLiteral("{%1}").arg(value.trimmed());
    QUuid id(withBraces);
    if (id.isNull()) {
        // Foreign UIDs are not UUIDs; derive a stable id from them.
        return QUuid::createUuidV5(QUuid(), value);
    }
    return id;
}

QString formatByDay(const QSet<int> &weekdays)
{
    QList<int> days = weekdays.values();
    std::sort(days.begin(), days.end());
    QStringList codes;
    for (int day : days) {
        if (day >= 0 && day < dayCodes().size()) {
            codes << dayCodes().at(day);
        }
    }
    return codes.join(',');
}

QSet<int> parseByDay(const QString &value)
{
    QSet<int> weekdays;
    const QStringList parts = value.split(',', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        // Positional prefixes such as "1MO" are not meaningful for weekly rules.
        const int index = dayCodes().indexOf(part.trimmed().right(2).toUpper());
        if (index >= 0) {
            weekdays.insert(index);
        }
    }
    return weekdays;
}

QString weeklyRecurrence(const QSet<int> &weekdays)
{
    return QStringLiteral("FREQ=WEEKLY;BYDAY=%1").arg(formatByDay(weekdays));
}

QSet<int> weekdaysFromRecurrence(const QString &rrule)
{
    const QStringList parts = rrule.split(';', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        if (part.startsWith(QLatin1String("BYDAY="), Qt::CaseInsensitive)) {
            return parseByDay(part.mid(6));
        }
    }
    return {};
}

} // namespace ics
} // namespace data
} // namespace timebox
