#pragma once

#include <optional>
#include <vector>

#include "timebox/data/WorkItem.hpp"

namespace timebox {
namespace data {

class WorkItemRepository
{
public:
    virtual ~WorkItemRepository() = default;

    // Ordered by ascending priority, ties by name.
    virtual std::vector<WorkItem> fetchWorkItems() const = 0;
    virtual std::optional<WorkItem> findById(const QUuid &id) const = 0;
    virtual WorkItem addWorkItem(WorkItem item) = 0;
    virtual bool updateWorkItem(const WorkItem &item) = 0;
    virtual bool removeWorkItem(const QUuid &id) = 0;

    /**
     * Renumbers priorities 1..n following @p orderedIds. Items missing from the
     * list keep their relative order behind the listed ones.
     */
    bool reorder(const std::vector<QUuid> &orderedIds);

protected:
    virtual bool storeWorkItems(const std::vector<WorkItem> &items) = 0;

    // Clamps negative hours and non-positive priorities.
    static WorkItem normalized(WorkItem item);
    int nextPriority() const;
};

} // namespace data
} // namespace timebox
