#include "timebox/core/Settings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

#include "timebox/core/Logging.hpp"

namespace timebox {
namespace core {

Settings Settings::load(const QSettings &settings)
{
    Settings result;

    const QByteArray zoneId = settings.value(QStringLiteral("scheduling/timeZone")).toString().toUtf8();
    if (!zoneId.isEmpty()) {
        const QTimeZone zone(zoneId);
        if (zone.isValid()) {
            result.scheduling.timeZone = zone;
        } else {
            qCWarning(lcCore) << "Unknown time zone" << zoneId << "- using the system zone";
        }
    }

    const auto &defaults = result.scheduling;
    result.scheduling.maxHorizonDays =
        qBound(1, settings.value(QStringLiteral("scheduling/maxHorizonDays"), defaults.maxHorizonDays).toInt(), 3660);
    result.scheduling.rescheduleHorizonDays = qBound(
        1, settings.value(QStringLiteral("scheduling/rescheduleHorizonDays"), defaults.rescheduleHorizonDays).toInt(),
        result.scheduling.maxHorizonDays);
    result.scheduling.minimumHorizonWeeks =
        qMax(0, settings.value(QStringLiteral("scheduling/minimumHorizonWeeks"), defaults.minimumHorizonWeeks).toInt());
    result.scheduling.horizonMarginWeeks =
        qMax(0, settings.value(QStringLiteral("scheduling/horizonMarginWeeks"), defaults.horizonMarginWeeks).toInt());
    result.debounceMs = qMax(0, settings.value(QStringLiteral("scheduling/debounceMs"), result.debounceMs).toInt());

    result.storagePath = settings.value(QStringLiteral("storage/path"), defaultStoragePath()).toString();
    result.busyCalendarPath = settings.value(QStringLiteral("sync/busyCalendarPath")).toString();
    result.exportCalendarPath = settings.value(QStringLiteral("sync/exportCalendarPath")).toString();
    return result;
}

void Settings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("scheduling/timeZone"), QString::fromUtf8(scheduling.timeZone.id()));
    settings.setValue(QStringLiteral("scheduling/maxHorizonDays"), scheduling.maxHorizonDays);
    settings.setValue(QStringLiteral("scheduling/rescheduleHorizonDays"), scheduling.rescheduleHorizonDays);
    settings.setValue(QStringLiteral("scheduling/minimumHorizonWeeks"), scheduling.minimumHorizonWeeks);
    settings.setValue(QStringLiteral("scheduling/horizonMarginWeeks"), scheduling.horizonMarginWeeks);
    settings.setValue(QStringLiteral("scheduling/debounceMs"), debounceMs);
    settings.setValue(QStringLiteral("storage/path"), storagePath);
    settings.setValue(QStringLiteral("sync/busyCalendarPath"), busyCalendarPath);
    settings.setValue(QStringLiteral("sync/exportCalendarPath"), exportCalendarPath);
}

QString Settings::defaultStoragePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/timebox");
    }
    return QDir(storageFolder).filePath(QStringLiteral("schedule.ics"));
}

} // namespace core
} // namespace timebox
