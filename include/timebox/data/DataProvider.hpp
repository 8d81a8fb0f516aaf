#pragma once

#include <memory>
#include <QString>

namespace timebox {
namespace data {

class WorkItemRepository;
class AvailabilityRepository;
class AssignmentRepository;
class FileScheduleStorage;

class DataProvider
{
public:
    explicit DataProvider(const QString &storagePath);
    ~DataProvider();

    WorkItemRepository &workItemRepository();
    AvailabilityRepository &availabilityRepository();
    AssignmentRepository &assignmentRepository();

private:
    std::shared_ptr<FileScheduleStorage> m_storage;
    std::unique_ptr<WorkItemRepository> m_workItemRepository;
    std::unique_ptr<AvailabilityRepository> m_availabilityRepository;
    std::unique_ptr<AssignmentRepository> m_assignmentRepository;
};

} // namespace data
} // namespace timebox
