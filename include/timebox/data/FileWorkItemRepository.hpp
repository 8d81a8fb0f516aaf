#pragma once

#include "timebox/data/FileScheduleStorage.hpp"
#include "timebox/data/WorkItemRepository.hpp"

#include <memory>

namespace timebox {
namespace data {

class FileWorkItemRepository : public WorkItemRepository
{
public:
    explicit FileWorkItemRepository(std::shared_ptr<FileScheduleStorage> storage);
    ~FileWorkItemRepository() override = default;

    std::vector<WorkItem> fetchWorkItems() const override;
    std::optional<WorkItem> findById(const QUuid &id) const override;
    WorkItem addWorkItem(WorkItem item) override;
    bool updateWorkItem(const WorkItem &item) override;
    bool removeWorkItem(const QUuid &id) override;

protected:
    bool storeWorkItems(const std::vector<WorkItem> &items) override;

private:
    std::shared_ptr<FileScheduleStorage> m_storage;
};

} // namespace data
} // namespace timebox
