#include "timebox/data/FileScheduleStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>
#include <algorithm>

#include "timebox/core/Logging.hpp"
#include "timebox/data/IcsFormat.hpp"

namespace timebox {
namespace data {

FileScheduleStorage::FileScheduleStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QString &FileScheduleStorage::filePath() const
{
    return m_filePath;
}

const QHash<QUuid, WorkItem> &FileScheduleStorage::workItems() const
{
    return m_workItems;
}

const QHash<QUuid, AvailabilityRule> &FileScheduleStorage::rules() const
{
    return m_rules;
}

const QList<QUuid> &FileScheduleStorage::ruleOrder() const
{
    return m_ruleOrder;
}

const QHash<QUuid, Assignment> &FileScheduleStorage::assignments() const
{
    return m_assignments;
}

bool FileScheduleStorage::storeWorkItems(const std::vector<WorkItem> &items)
{
    return commit([&]() {
        for (const auto &item : items) {
            m_workItems.insert(item.id, item);
        }
    });
}

bool FileScheduleStorage::removeWorkItem(const QUuid &id)
{
    if (!m_workItems.contains(id)) {
        return false;
    }
    return commit([&]() {
        m_workItems.remove(id);
        for (auto it = m_assignments.begin(); it != m_assignments.end();) {
            if (it.value().workItemId == id && it.value().status != AssignmentStatus::Completed) {
                it = m_assignments.erase(it);
            } else {
                ++it;
            }
        }
    });
}

bool FileScheduleStorage::storeRule(const AvailabilityRule &rule)
{
    return commit([&]() {
        if (!m_rules.contains(rule.id)) {
            m_ruleOrder.append(rule.id);
        }
        m_rules.insert(rule.id, rule);
    });
}

bool FileScheduleStorage::removeRule(const QUuid &id)
{
    if (!m_rules.contains(id)) {
        return false;
    }
    return commit([&]() {
        m_rules.remove(id);
        m_ruleOrder.removeAll(id);
    });
}

bool FileScheduleStorage::storeAssignments(const std::vector<Assignment> &assignments)
{
    return replaceAssignments({}, assignments);
}

bool FileScheduleStorage::replaceAssignments(const std::function<bool(const Assignment &)> &removeIf,
                                             const std::vector<Assignment> &added)
{
    return commit([&]() {
        if (removeIf) {
            for (auto it = m_assignments.begin(); it != m_assignments.end();) {
                if (removeIf(it.value())) {
                    it = m_assignments.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto assignment : added) {
            if (assignment.id.isNull()) {
                assignment.id = QUuid::createUuid();
            }
            m_assignments.insert(assignment.id, assignment);
        }
    });
}

bool FileScheduleStorage::commit(const std::function<void()> &mutation)
{
    const auto workItems = m_workItems;
    const auto rules = m_rules;
    const auto ruleOrder = m_ruleOrder;
    const auto assignments = m_assignments;

    mutation();
    if (save()) {
        return true;
    }

    m_workItems = workItems;
    m_rules = rules;
    m_ruleOrder = ruleOrder;
    m_assignments = assignments;
    return false;
}

void FileScheduleStorage::load()
{
    m_workItems.clear();
    m_rules.clear();
    m_ruleOrder.clear();
    m_assignments.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcData) << "Cannot read" << m_filePath << file.errorString();
        return;
    }

    enum class Section {
        None,
        Item,
        Rule,
        Assignment
    };

    Section currentSection = Section::None;
    WorkItem currentItem;
    AvailabilityRule currentRule;
    Assignment currentAssignment;

    auto finalizeItem = [&]() {
        if (currentItem.id.isNull()) {
            currentItem.id = QUuid::createUuid();
        }
        m_workItems.insert(currentItem.id, currentItem);
    };

    auto finalizeRule = [&]() {
        if (currentRule.id.isNull()) {
            currentRule.id = QUuid::createUuid();
        }
        if (!m_rules.contains(currentRule.id)) {
            m_ruleOrder.append(currentRule.id);
        }
        m_rules.insert(currentRule.id, currentRule);
    };

    auto finalizeAssignment = [&]() {
        if (!currentAssignment.start.isValid() || !currentAssignment.end.isValid()) {
            qCWarning(lcData) << "Dropping stored assignment without a valid window";
            return;
        }
        if (currentAssignment.id.isNull()) {
            currentAssignment.id = QUuid::createUuid();
        }
        if (currentAssignment.durationHours <= 0.0) {
            currentAssignment.durationHours = currentAssignment.start.secsTo(currentAssignment.end) / 3600.0;
        }
        m_assignments.insert(currentAssignment.id, currentAssignment);
    };

    const QStringList lines = ics::readUnfoldedLines(file);
    for (const QString &line : lines) {
        if (line == QLatin1String("BEGIN:VTODO")) {
            currentSection = Section::Item;
            currentItem = WorkItem{};
            continue;
        }
        if (line == QLatin1String("BEGIN:VAVAILABILITY")) {
            currentSection = Section::Rule;
            currentRule = AvailabilityRule{};
            continue;
        }
        if (line == QLatin1String("BEGIN:VEVENT")) {
            currentSection = Section::Assignment;
            currentAssignment = Assignment{};
            continue;
        }
        if (line == QLatin1String("END:VTODO") && currentSection == Section::Item) {
            finalizeItem();
            currentSection = Section::None;
            continue;
        }
        if (line == QLatin1String("END:VAVAILABILITY") && currentSection == Section::Rule) {
            finalizeRule();
            currentSection = Section::None;
            continue;
        }
        if (line == QLatin1String("END:VEVENT") && currentSection == Section::Assignment) {
            finalizeAssignment();
            currentSection = Section::None;
            continue;
        }

        if (currentSection == Section::None) {
            continue;
        }

        IcsProperty property;
        if (!ics::parseProperty(line, property)) {
            continue;
        }
        const QString &name = property.name;

        if (currentSection == Section::Item) {
            if (name == QLatin1String("UID")) {
                currentItem.id = ics::parseUid(property.value);
            } else if (name == QLatin1String("SUMMARY")) {
                currentItem.name = property.value;
            } else if (name == QLatin1String("DESCRIPTION")) {
                currentItem.description = property.value;
            } else if (name == QLatin1String("DUE")) {
                currentItem.dueDate = ics::parseDateTime(property.rawValue, property.parameters);
            } else if (name == QLatin1String("PRIORITY")) {
                currentItem.priority = std::max(1, property.rawValue.toInt());
            } else if (name == QLatin1String("STATUS")) {
                currentItem.status = itemStatusFromString(property.rawValue);
            } else if (name == QLatin1String("X-TIMEBOX-HOURS")) {
                currentItem.estimatedHours = std::max(0.0, property.rawValue.toDouble());
            }
            continue;
        }

        if (currentSection == Section::Rule) {
            if (name == QLatin1String("UID")) {
                currentRule.id = ics::parseUid(property.value);
            } else if (name == QLatin1String("SUMMARY")) {
                currentRule.name = property.value;
            } else if (name == QLatin1String("RRULE")) {
                currentRule.weekdays = ics::weekdaysFromRecurrence(property.rawValue);
            } else if (name == QLatin1String("X-TIMEBOX-START")) {
                currentRule.startTime = parseClockTime(property.rawValue).value_or(QTime());
            } else if (name == QLatin1String("X-TIMEBOX-END")) {
                currentRule.endTime = parseClockTime(property.rawValue).value_or(QTime());
            } else if (name == QLatin1String("X-TIMEBOX-ACTIVE")) {
                currentRule.active = property.rawValue.compare(QLatin1String("TRUE"), Qt::CaseInsensitive) == 0;
            } else if (name == QLatin1String("X-TIMEBOX-MIN-DURATION")) {
                currentRule.minimumDurationMinutes = property.rawValue.toInt();
            }
            continue;
        }

        if (name == QLatin1String("UID")) {
            currentAssignment.id = ics::parseUid(property.value);
        } else if (name == QLatin1String("SUMMARY")) {
            currentAssignment.workItemName = property.value;
        } else if (name == QLatin1String("RELATED-TO")) {
            currentAssignment.workItemId = ics::parseUid(property.value);
        } else if (name == QLatin1String("DTSTART")) {
            currentAssignment.start = ics::parseDateTime(property.rawValue, property.parameters);
        } else if (name == QLatin1String("DTEND")) {
            currentAssignment.end = ics::parseDateTime(property.rawValue, property.parameters);
        } else if (name == QLatin1String("PRIORITY")) {
            currentAssignment.priority = property.rawValue.toInt();
        } else if (name == QLatin1String("COLOR")) {
            currentAssignment.color = property.value;
        } else if (name == QLatin1String("X-TIMEBOX-STATUS")) {
            currentAssignment.status = assignmentStatusFromString(property.rawValue);
        } else if (name == QLatin1String("X-TIMEBOX-HOURS")) {
            currentAssignment.durationHours = property.rawValue.toDouble();
        } else if (name == QLatin1String("X-TIMEBOX-REMOTE-ID")) {
            currentAssignment.remoteEventId = property.value;
        }
    }
    qCDebug(lcData) << "Loaded" << m_workItems.size() << "items," << m_rules.size() << "rules,"
                    << m_assignments.size() << "assignments from" << m_filePath;
}

bool FileScheduleStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcData) << "Cannot create directory" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcData) << "Cannot write" << m_filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Timebox//EN\n";

    for (const QUuid &id : m_ruleOrder) {
        const AvailabilityRule &rule = m_rules[id];
        stream << "BEGIN:VAVAILABILITY\n";
        stream << "UID:" << ics::formatUid(rule.id) << '\n';
        stream << "SUMMARY:" << ics::encodeText(rule.name) << '\n';
        stream << "RRULE:" << ics::weeklyRecurrence(rule.weekdays) << '\n';
        stream << "X-TIMEBOX-START:" << formatClockTime(rule.startTime) << '\n';
        stream << "X-TIMEBOX-END:" << formatClockTime(rule.endTime) << '\n';
        stream << "X-TIMEBOX-ACTIVE:" << (rule.active ? "TRUE" : "FALSE") << '\n';
        if (rule.minimumDurationMinutes > 0) {
            stream << "X-TIMEBOX-MIN-DURATION:" << rule.minimumDurationMinutes << '\n';
        }
        stream << "END:VAVAILABILITY\n";
    }

    auto items = m_workItems.values();
    std::sort(items.begin(), items.end(), [](const WorkItem &lhs, const WorkItem &rhs) {
        return lhs.priority < rhs.priority;
    });
    for (const WorkItem &item : items) {
        stream << "BEGIN:VTODO\n";
        stream << "UID:" << ics::formatUid(item.id) << '\n';
        stream << "SUMMARY:" << ics::encodeText(item.name) << '\n';
        if (!item.description.isEmpty()) {
            stream << "DESCRIPTION:" << ics::encodeText(item.description) << '\n';
        }
        if (item.dueDate.isValid()) {
            stream << "DUE:" << ics::formatDateTime(item.dueDate) << '\n';
        }
        stream << "PRIORITY:" << item.priority << '\n';
        stream << "STATUS:" << itemStatusToString(item.status) << '\n';
        stream << "X-TIMEBOX-HOURS:" << QString::number(item.estimatedHours, 'g', 10) << '\n';
        stream << "END:VTODO\n";
    }

    auto assignments = m_assignments.values();
    std::sort(assignments.begin(), assignments.end(), [](const Assignment &lhs, const Assignment &rhs) {
        return lhs.start < rhs.start;
    });
    for (const Assignment &assignment : assignments) {
        stream << "BEGIN:VEVENT\n";
        stream << "UID:" << ics::formatUid(assignment.id) << '\n';
        stream << "SUMMARY:" << ics::encodeText(assignment.workItemName) << '\n';
        stream << "RELATED-TO:" << ics::formatUid(assignment.workItemId) << '\n';
        stream << "DTSTART:" << ics::formatDateTime(assignment.start) << '\n';
        stream << "DTEND:" << ics::formatDateTime(assignment.end) << '\n';
        stream << "PRIORITY:" << assignment.priority << '\n';
        if (!assignment.color.isEmpty()) {
            stream << "COLOR:" << ics::encodeText(assignment.color) << '\n';
        }
        stream << "X-TIMEBOX-STATUS:" << assignmentStatusToString(assignment.status) << '\n';
        stream << "X-TIMEBOX-HOURS:" << QString::number(assignment.durationHours, 'g', 10) << '\n';
        if (!assignment.remoteEventId.isEmpty()) {
            stream << "X-TIMEBOX-REMOTE-ID:" << ics::encodeText(assignment.remoteEventId) << '\n';
        }
        stream << "END:VEVENT\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (stream.status() != QTextStream::Ok) {
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qCWarning(lcData) << "Cannot commit" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

QString FileScheduleStorage::itemStatusToString(WorkItemStatus status)
{
    switch (status) {
    case WorkItemStatus::Completed:
        return QStringLiteral("COMPLETED");
    case WorkItemStatus::Scheduled:
        return QStringLiteral("IN-PROCESS");
    case WorkItemStatus::Pending:
    default:
        return QStringLiteral("NEEDS-ACTION");
    }
}

WorkItemStatus FileScheduleStorage::itemStatusFromString(const QString &value)
{
    const QString normalized = value.toUpper();
    if (normalized == QLatin1String("COMPLETED")) {
        return WorkItemStatus::Completed;
    }
    if (normalized == QLatin1String("IN-PROCESS")) {
        return WorkItemStatus::Scheduled;
    }
    return WorkItemStatus::Pending;
}

QString FileScheduleStorage::assignmentStatusToString(AssignmentStatus status)
{
    switch (status) {
    case AssignmentStatus::Completed:
        return QStringLiteral("COMPLETED");
    case AssignmentStatus::Conflicted:
        return QStringLiteral("CONFLICTED");
    case AssignmentStatus::Scheduled:
    default:
        return QStringLiteral("SCHEDULED");
    }
}

AssignmentStatus FileScheduleStorage::assignmentStatusFromString(const QString &value)
{
    const QString normalized = value.toUpper();
    if (normalized == QLatin1String("COMPLETED")) {
        return AssignmentStatus::Completed;
    }
    if (normalized == QLatin1String("CONFLICTED")) {
        return AssignmentStatus::Conflicted;
    }
    return AssignmentStatus::Scheduled;
}

} // namespace data
} // namespace timebox
