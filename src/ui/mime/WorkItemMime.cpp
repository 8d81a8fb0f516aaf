#include "timebox/ui/mime/WorkItemMime.hpp"

#include <QDataStream>

namespace timebox {
namespace ui {

namespace {
constexpr quint32 CurrentWorkItemMimeVersion = 1;
} // namespace

QByteArray encodeWorkItemMime(const QList<WorkItemMimeEntry> &entries)
{
    QByteArray buffer;
    QDataStream stream(&buffer, QIODevice::WriteOnly);
    stream << WorkItemMimeMagic << CurrentWorkItemMimeVersion << quint32(entries.size());
    for (const auto &entry : entries) {
        stream << entry.id << entry.name << entry.estimatedHours;
    }
    return buffer;
}

QVector<WorkItemMimeEntry> decodeWorkItemMime(const QByteArray &payload)
{
    QVector<WorkItemMimeEntry> entries;
    if (payload.isEmpty()) {
        return entries;
    }
    QDataStream stream(payload);

    quint32 magic = 0;
    quint32 version = 0;
    quint32 count = 0;
    stream >> magic >> version >> count;
    if (magic != WorkItemMimeMagic || version == 0 || version > CurrentWorkItemMimeVersion) {
        return entries;
    }
    for (quint32 i = 0; i < count && !stream.atEnd(); ++i) {
        WorkItemMimeEntry entry;
        stream >> entry.id >> entry.name >> entry.estimatedHours;
        if (stream.status() != QDataStream::Ok) {
            break;
        }
        entries.append(entry);
    }
    return entries;
}

} // namespace ui
} // namespace timebox
