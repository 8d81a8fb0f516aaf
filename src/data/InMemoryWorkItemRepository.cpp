#include "timebox/data/InMemoryWorkItemRepository.hpp"

#include <algorithm>

namespace timebox {
namespace data {

InMemoryWorkItemRepository::InMemoryWorkItemRepository() = default;
InMemoryWorkItemRepository::~InMemoryWorkItemRepository() = default;

std::vector<WorkItem> InMemoryWorkItemRepository::fetchWorkItems() const
{
    std::vector<WorkItem> items;
    items.reserve(static_cast<size_t>(m_items.size()));
    for (const auto &item : m_items) {
        items.push_back(item);
    }
    std::sort(items.begin(), items.end(), [](const WorkItem &lhs, const WorkItem &rhs) {
        if (lhs.priority == rhs.priority) {
            return lhs.name.toLower() < rhs.name.toLower();
        }
        return lhs.priority < rhs.priority;
    });
    return items;
}

std::optional<WorkItem> InMemoryWorkItemRepository::findById(const QUuid &id) const
{
    if (m_items.contains(id)) {
        return m_items.value(id);
    }
    return std::nullopt;
}

WorkItem InMemoryWorkItemRepository::addWorkItem(WorkItem item)
{
    item.priority = nextPriority();
    item = normalized(std::move(item));
    m_items.insert(item.id, item);
    return item;
}

bool InMemoryWorkItemRepository::updateWorkItem(const WorkItem &item)
{
    if (!m_items.contains(item.id)) {
        return false;
    }
    m_items.insert(item.id, normalized(item));
    return true;
}

bool InMemoryWorkItemRepository::removeWorkItem(const QUuid &id)
{
    return m_items.remove(id) > 0;
}

bool InMemoryWorkItemRepository::storeWorkItems(const std::vector<WorkItem> &items)
{
    for (const auto &item : items) {
        m_items.insert(item.id, normalized(item));
    }
    return true;
}

} // namespace data
} // namespace timebox
