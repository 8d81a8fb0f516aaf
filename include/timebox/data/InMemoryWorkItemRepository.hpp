#pragma once

#include <QHash>

#include "timebox/data/WorkItemRepository.hpp"

namespace timebox {
namespace data {

class InMemoryWorkItemRepository : public WorkItemRepository
{
public:
    InMemoryWorkItemRepository();
    ~InMemoryWorkItemRepository() override;

    std::vector<WorkItem> fetchWorkItems() const override;
    std::optional<WorkItem> findById(const QUuid &id) const override;
    WorkItem addWorkItem(WorkItem item) override;
    bool updateWorkItem(const WorkItem &item) override;
    bool removeWorkItem(const QUuid &id) override;

protected:
    bool storeWorkItems(const std::vector<WorkItem> &items) override;

private:
    QHash<QUuid, WorkItem> m_items;
};

} // namespace data
} // namespace timebox
