#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <QTimeZone>
#include <optional>

#include "version.h"

#include "timebox/core/AppContext.hpp"
#include "timebox/core/ScheduleRecalculator.hpp"
#include "timebox/data/AssignmentRepository.hpp"
#include "timebox/data/AvailabilityRepository.hpp"
#include "timebox/data/IcsFormat.hpp"
#include "timebox/data/WorkItemRepository.hpp"
#include "timebox/engine/PriorityScheduler.hpp"
#include "timebox/ui/models/WorkItemListModel.hpp"
#include "timebox/ui/viewmodels/ScheduleViewModel.hpp"

using namespace timebox;

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

QString shortId(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces).left(8);
}

// Accepts a full id or an unambiguous prefix of one.
template <typename T>
std::optional<T> findByIdPrefix(const std::vector<T> &candidates, const QString &prefix)
{
    std::optional<T> match;
    for (const auto &candidate : candidates) {
        if (!candidate.id.toString(QUuid::WithoutBraces).startsWith(prefix, Qt::CaseInsensitive)) {
            continue;
        }
        if (match) {
            err() << QObject::tr("Id prefix \"%1\" is ambiguous").arg(prefix) << Qt::endl;
            return std::nullopt;
        }
        match = candidate;
    }
    if (!match) {
        err() << QObject::tr("No entry with id \"%1\"").arg(prefix) << Qt::endl;
    }
    return match;
}

QString statusText(data::WorkItemStatus status)
{
    switch (status) {
    case data::WorkItemStatus::Completed:
        return QStringLiteral("completed");
    case data::WorkItemStatus::Scheduled:
        return QStringLiteral("scheduled");
    case data::WorkItemStatus::Pending:
    default:
        return QStringLiteral("pending");
    }
}

QString statusText(data::AssignmentStatus status)
{
    switch (status) {
    case data::AssignmentStatus::Completed:
        return QStringLiteral("completed");
    case data::AssignmentStatus::Conflicted:
        return QStringLiteral("conflicted");
    case data::AssignmentStatus::Scheduled:
    default:
        return QStringLiteral("scheduled");
    }
}

int printReport(const core::RecalculationReport &report)
{
    if (!report.ok) {
        err() << report.summary() << Qt::endl;
        return 2;
    }
    out() << report.summary() << Qt::endl;
    for (const auto &remainder : report.unscheduled) {
        out() << QObject::tr("  %1: %2h unscheduled").arg(remainder.workItemName).arg(remainder.hours, 0, 'f', 2)
              << Qt::endl;
    }
    return 0;
}

int listSchedule(core::AppContext &context)
{
    const QTimeZone zone = context.settings().scheduling.timeZone;
    const auto assignments = context.assignmentRepository().fetchAssignments();

    out() << QObject::tr("Availability:") << Qt::endl;
    for (const auto &rule : context.availabilityRepository().fetchRules()) {
        out() << "  " << shortId(rule.id) << "  " << rule.name << "  " << data::ics::formatByDay(rule.weekdays) << "  "
              << data::formatClockTime(rule.startTime) << '-' << data::formatClockTime(rule.endTime);
        if (!rule.active) {
            out() << QObject::tr("  (inactive)");
        }
        out() << Qt::endl;
    }

    out() << QObject::tr("Work items:") << Qt::endl;
    for (const auto &item : context.workItemRepository().fetchWorkItems()) {
        out() << "  " << shortId(item.id) << "  #" << item.priority << "  " << item.name << "  " << item.estimatedHours
              << "h  " << statusText(item.status);
        if (const auto span = engine::scheduledSpan(item.id, assignments)) {
            out() << "  " << span->start.toTimeZone(zone).toString(QStringLiteral("yyyy-MM-dd")) << " .. "
                  << span->end.toTimeZone(zone).toString(QStringLiteral("yyyy-MM-dd"));
        }
        out() << Qt::endl;
    }

    out() << QObject::tr("Sessions:") << Qt::endl;
    for (const auto &assignment : assignments) {
        out() << "  " << shortId(assignment.id) << "  "
              << assignment.start.toTimeZone(zone).toString(QStringLiteral("ddd yyyy-MM-dd HH:mm")) << '-'
              << assignment.end.toTimeZone(zone).toString(QStringLiteral("HH:mm")) << "  " << assignment.workItemName
              << "  " << assignment.durationHours << "h  " << statusText(assignment.status) << Qt::endl;
    }
    return 0;
}

int addItem(core::AppContext &context, const QStringList &args, const QCommandLineParser &parser)
{
    if (args.size() < 2) {
        err() << QObject::tr("usage: timebox add-item <name> <hours>") << Qt::endl;
        return 1;
    }
    bool ok = false;
    const double hours = args.at(1).toDouble(&ok);
    if (!ok || hours < 0.0) {
        err() << QObject::tr("Estimated hours must be a non-negative number") << Qt::endl;
        return 1;
    }
    data::WorkItem item;
    item.name = args.at(0);
    item.estimatedHours = hours;
    item.description = parser.value(QStringLiteral("description"));
    const auto stored = context.workItemRepository().addWorkItem(item);
    out() << QObject::tr("Added %1 with priority %2").arg(shortId(stored.id)).arg(stored.priority) << Qt::endl;
    return 0;
}

int addRule(core::AppContext &context, const QStringList &args, const QCommandLineParser &parser)
{
    if (args.size() < 4) {
        err() << QObject::tr("usage: timebox add-rule <name> <MO,TU,...> <HH:MM> <HH:MM>") << Qt::endl;
        return 1;
    }
    data::AvailabilityRule rule;
    rule.name = args.at(0);
    rule.weekdays = data::ics::parseByDay(args.at(1));
    const auto start = data::parseClockTime(args.at(2));
    const auto end = data::parseClockTime(args.at(3));
    if (!start || !end) {
        err() << QObject::tr("Times must be given as HH:MM") << Qt::endl;
        return 1;
    }
    rule.startTime = *start;
    rule.endTime = *end;
    rule.minimumDurationMinutes = parser.value(QStringLiteral("min-duration")).toInt();

    const QString problem = data::validateRule(rule);
    if (!problem.isEmpty()) {
        err() << problem << Qt::endl;
        return 1;
    }
    const auto stored = context.availabilityRepository().addRule(rule);
    out() << QObject::tr("Added rule %1").arg(shortId(stored.id)) << Qt::endl;
    return 0;
}

int removeItem(core::AppContext &context, const QStringList &args)
{
    if (args.isEmpty()) {
        err() << QObject::tr("usage: timebox remove-item <id>") << Qt::endl;
        return 1;
    }
    const auto item = findByIdPrefix(context.workItemRepository().fetchWorkItems(), args.at(0));
    if (!item) {
        return 1;
    }
    if (!context.recalculator().removeWorkItem(item->id)) {
        err() << QObject::tr("Could not remove %1").arg(item->name) << Qt::endl;
        return 2;
    }
    return 0;
}

int moveItem(core::AppContext &context, const QStringList &args)
{
    if (args.size() < 2) {
        err() << QObject::tr("usage: timebox move <id> <position>") << Qt::endl;
        return 1;
    }
    ui::WorkItemListModel model(context.workItemRepository());
    const auto items = context.workItemRepository().fetchWorkItems();
    const auto item = findByIdPrefix(items, args.at(0));
    if (!item) {
        return 1;
    }
    int from = -1;
    for (int row = 0; row < model.rowCount(); ++row) {
        if (model.data(model.index(row), ui::WorkItemListModel::IdRole).toUuid() == item->id) {
            from = row;
            break;
        }
    }
    const int to = qBound(0, args.at(1).toInt() - 1, model.rowCount() - 1);
    if (from < 0 || !model.moveItem(from, to)) {
        err() << QObject::tr("Could not reorder work items") << Qt::endl;
        return 2;
    }
    return 0;
}

int completeAssignment(core::AppContext &context, const QStringList &args)
{
    if (args.isEmpty()) {
        err() << QObject::tr("usage: timebox complete <session-id>") << Qt::endl;
        return 1;
    }
    const auto assignment = findByIdPrefix(context.assignmentRepository().fetchAssignments(), args.at(0));
    if (!assignment) {
        return 1;
    }
    if (!context.recalculator().completeAssignment(assignment->id)) {
        err() << QObject::tr("Could not complete session %1").arg(shortId(assignment->id)) << Qt::endl;
        return 2;
    }
    return 0;
}

int watch(QCoreApplication &app, core::AppContext &context)
{
    const QString busyPath = context.settings().busyCalendarPath;
    if (busyPath.isEmpty()) {
        err() << QObject::tr("watch needs --busy-calendar or sync/busyCalendarPath") << Qt::endl;
        return 1;
    }

    ui::ScheduleViewModel viewModel(context.assignmentRepository(), context.recalculator());
    viewModel.setDebounceInterval(context.settings().debounceMs);
    QObject::connect(&viewModel, &ui::ScheduleViewModel::recalculated, &app,
                     [&viewModel]() { printReport(viewModel.lastReport()); });

    QFileSystemWatcher watcher;
    watcher.addPath(busyPath);
    QObject::connect(&watcher, &QFileSystemWatcher::fileChanged, &viewModel, [&](const QString &path) {
        // Atomic replacements drop the path from the watcher.
        if (!watcher.files().contains(path) && QFileInfo::exists(path)) {
            watcher.addPath(path);
        }
        viewModel.calendarChanged();
    });

    viewModel.recalculateNow();
    out() << QObject::tr("Watching %1 for changes").arg(busyPath) << Qt::endl;
    return app.exec();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Timebox"));
    QCoreApplication::setApplicationName(QStringLiteral("timebox"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTimeboxVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Time-boxes prioritized work items into weekly availability."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QObject::tr("list, add-item, add-rule, remove-item, move, complete, recalculate, "
                                             "reconcile or watch"));
    parser.addOptions({
        { QStringLiteral("storage"), QObject::tr("Schedule file."), QStringLiteral("path") },
        { QStringLiteral("busy-calendar"), QObject::tr("iCalendar file with busy time."), QStringLiteral("path") },
        { QStringLiteral("export-calendar"), QObject::tr("iCalendar file to publish sessions to."),
          QStringLiteral("path") },
        { QStringLiteral("timezone"), QObject::tr("IANA time zone for availability rules."), QStringLiteral("zone") },
        { QStringLiteral("description"), QObject::tr("Description for add-item."), QStringLiteral("text") },
        { QStringLiteral("min-duration"), QObject::tr("Minimum slot length in minutes for add-rule."),
          QStringLiteral("minutes") },
        { QStringLiteral("no-recalculate"), QObject::tr("Do not rebuild the schedule after an edit.") },
        { { QStringLiteral("v"), QStringLiteral("verbose") }, QObject::tr("Debug logging.") },
    });
    parser.process(app);

    if (parser.isSet(QStringLiteral("verbose"))) {
        QLoggingCategory::setFilterRules(QStringLiteral("timebox.*.debug=true"));
    }

    QSettings storedSettings;
    core::Settings settings = core::Settings::load(storedSettings);
    if (parser.isSet(QStringLiteral("storage"))) {
        settings.storagePath = parser.value(QStringLiteral("storage"));
    }
    if (parser.isSet(QStringLiteral("busy-calendar"))) {
        settings.busyCalendarPath = parser.value(QStringLiteral("busy-calendar"));
    }
    if (parser.isSet(QStringLiteral("export-calendar"))) {
        settings.exportCalendarPath = parser.value(QStringLiteral("export-calendar"));
    }
    if (parser.isSet(QStringLiteral("timezone"))) {
        const QTimeZone zone(parser.value(QStringLiteral("timezone")).toUtf8());
        if (!zone.isValid()) {
            err() << QObject::tr("Unknown time zone %1").arg(parser.value(QStringLiteral("timezone"))) << Qt::endl;
            return 1;
        }
        settings.scheduling.timeZone = zone;
    }

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.takeFirst();

    core::AppContext context(settings);
    auto &recalculator = context.recalculator();

    int result = 0;
    bool edited = false;
    if (command == QLatin1String("list")) {
        return listSchedule(context);
    } else if (command == QLatin1String("recalculate")) {
        return printReport(recalculator.recalculate());
    } else if (command == QLatin1String("reconcile")) {
        return printReport(recalculator.reconcile());
    } else if (command == QLatin1String("watch")) {
        return watch(app, context);
    } else if (command == QLatin1String("add-item")) {
        result = addItem(context, args, parser);
        edited = true;
    } else if (command == QLatin1String("add-rule")) {
        result = addRule(context, args, parser);
        edited = true;
    } else if (command == QLatin1String("remove-item")) {
        result = removeItem(context, args);
        edited = true;
    } else if (command == QLatin1String("move")) {
        result = moveItem(context, args);
        edited = true;
    } else if (command == QLatin1String("complete")) {
        result = completeAssignment(context, args);
    } else {
        err() << QObject::tr("Unknown command %1").arg(command) << Qt::endl;
        return 1;
    }

    if (result == 0 && edited && !parser.isSet(QStringLiteral("no-recalculate"))) {
        result = printReport(recalculator.recalculate());
    }
    return result;
}
