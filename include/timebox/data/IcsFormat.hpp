#pragma once

#include <QDateTime>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QUuid>

class QIODevice;

namespace timebox {
namespace data {

struct IcsProperty
{
    QString name;       // upper-cased, parameters stripped
    QString parameters; // everything after the first ';' of the property part
    QString rawValue;
    QString value;      // rawValue with text escapes decoded
};

namespace ics {

// Reads all content lines from @p device, joining folded continuation lines.
QStringList readUnfoldedLines(QIODevice &device);
bool parseProperty(const QString &line, IcsProperty &property);

QString encodeText(const QString &text);
QString decodeText(const QString &text);
QString formatDateTime(const QDateTime &dt);
QDateTime parseDateTime(const QString &value, const QString &parameters = QString());

QString formatUid(const QUuid &id);
QUuid parseUid(const QString &value);

// "MO,WE,FR" <-> {1, 3, 5}
QString formatByDay(const QSet<int> &weekdays);
QSet<int> parseByDay(const QString &value);
QString weeklyRecurrence(const QSet<int> &weekdays);
QSet<int> weekdaysFromRecurrence(const QString &rrule);

} // namespace ics
} // namespace data
} // namespace timebox
