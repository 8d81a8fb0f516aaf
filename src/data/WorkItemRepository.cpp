#include "timebox/data/WorkItemRepository.hpp"

#include <QSet>
#include <algorithm>

#include "timebox/core/Logging.hpp"

namespace timebox {
namespace data {

bool WorkItemRepository::reorder(const std::vector<QUuid> &orderedIds)
{
    const auto current = fetchWorkItems();
    std::vector<WorkItem> reordered;
    reordered.reserve(current.size());

    QSet<QUuid> placed;
    for (const auto &id : orderedIds) {
        if (placed.contains(id)) {
            continue;
        }
        auto it = std::find_if(current.begin(), current.end(), [&](const WorkItem &item) { return item.id == id; });
        if (it == current.end()) {
            qCWarning(lcData) << "Ignoring unknown work item in reorder:" << id;
            continue;
        }
        reordered.push_back(*it);
        placed.insert(id);
    }
    for (const auto &item : current) {
        if (!placed.contains(item.id)) {
            reordered.push_back(item);
        }
    }

    std::vector<WorkItem> changed;
    int priority = 1;
    for (auto &item : reordered) {
        if (item.priority != priority) {
            item.priority = priority;
            changed.push_back(item);
        }
        ++priority;
    }
    if (changed.empty()) {
        return true;
    }
    return storeWorkItems(changed);
}

WorkItem WorkItemRepository::normalized(WorkItem item)
{
    if (item.id.isNull()) {
        item.id = QUuid::createUuid();
    }
    if (item.estimatedHours < 0.0) {
        qCWarning(lcData).noquote() << "Clamping negative hours of" << item.name << "to 0";
        item.estimatedHours = 0.0;
    }
    if (item.priority < 1) {
        item.priority = 1;
    }
    return item;
}

int WorkItemRepository::nextPriority() const
{
    int highest = 0;
    for (const auto &item : fetchWorkItems()) {
        highest = std::max(highest, item.priority);
    }
    return highest + 1;
}

} // namespace data
} // namespace timebox
