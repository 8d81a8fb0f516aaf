#pragma once

#include <QByteArray>
#include <QList>
#include <QVector>
#include <QtGlobal>

#include <QString>
#include <QUuid>

namespace timebox {
namespace ui {

constexpr const char *WorkItemMimeType = "application/x-timebox-work-items";
constexpr quint32 WorkItemMimeMagic = 0x54424F58; // "TBOX"

struct WorkItemMimeEntry
{
    QUuid id;
    QString name;
    double estimatedHours = 0.0;
};

QByteArray encodeWorkItemMime(const QList<WorkItemMimeEntry> &entries);
QVector<WorkItemMimeEntry> decodeWorkItemMime(const QByteArray &payload);

} // namespace ui
} // namespace timebox
