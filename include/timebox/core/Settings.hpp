#pragma once

#include <QString>

#include "timebox/engine/SchedulingOptions.hpp"

class QSettings;

namespace timebox {
namespace core {

struct Settings
{
    engine::SchedulingOptions scheduling;
    int debounceMs = 1000;
    QString storagePath;
    QString busyCalendarPath;   // external calendar export, read-only
    QString exportCalendarPath; // where work sessions are published

    static Settings load(const QSettings &settings);
    void save(QSettings &settings) const;

    static QString defaultStoragePath();
};

} // namespace core
} // namespace timebox
