#include "timebox/data/FileWorkItemRepository.hpp"

#include <algorithm>

#include "timebox/core/Logging.hpp"

namespace timebox {
namespace data {

FileWorkItemRepository::FileWorkItemRepository(std::shared_ptr<FileScheduleStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<WorkItem> FileWorkItemRepository::fetchWorkItems() const
{
    std::vector<WorkItem> result;
    if (!m_storage) {
        return result;
    }
    const auto &items = m_storage->workItems();
    result.reserve(static_cast<size_t>(items.size()));
    for (auto it = items.constBegin(); it != items.constEnd(); ++it) {
        result.push_back(it.value());
    }
    std::sort(result.begin(), result.end(), [](const WorkItem &lhs, const WorkItem &rhs) {
        if (lhs.priority == rhs.priority) {
            return lhs.name.toLower() < rhs.name.toLower();
        }
        return lhs.priority < rhs.priority;
    });
    return result;
}

std::optional<WorkItem> FileWorkItemRepository::findById(const QUuid &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &items = m_storage->workItems();
    if (items.contains(id)) {
        return items.value(id);
    }
    return std::nullopt;
}

WorkItem FileWorkItemRepository::addWorkItem(WorkItem item)
{
    item.priority = nextPriority();
    item = normalized(std::move(item));
    if (m_storage && !m_storage->storeWorkItems({ item })) {
        qCWarning(lcData).noquote() << "Work item" << item.name << "was not saved";
    }
    return item;
}

bool FileWorkItemRepository::updateWorkItem(const WorkItem &item)
{
    if (!m_storage) {
        return false;
    }
    if (!m_storage->workItems().contains(item.id)) {
        return false;
    }
    return m_storage->storeWorkItems({ normalized(item) });
}

bool FileWorkItemRepository::removeWorkItem(const QUuid &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeWorkItem(id);
}

bool FileWorkItemRepository::storeWorkItems(const std::vector<WorkItem> &items)
{
    if (!m_storage) {
        return false;
    }
    std::vector<WorkItem> normalizedItems;
    normalizedItems.reserve(items.size());
    for (const auto &item : items) {
        normalizedItems.push_back(normalized(item));
    }
    return m_storage->storeWorkItems(normalizedItems);
}

} // namespace data
} // namespace timebox
