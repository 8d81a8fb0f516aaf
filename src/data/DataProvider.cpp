#include "timebox/data/DataProvider.hpp"

#include "timebox/data/FileAssignmentRepository.hpp"
#include "timebox/data/FileAvailabilityRepository.hpp"
#include "timebox/data/FileScheduleStorage.hpp"
#include "timebox/data/FileWorkItemRepository.hpp"

namespace timebox {
namespace data {

DataProvider::DataProvider(const QString &storagePath)
    : m_storage(std::make_shared<FileScheduleStorage>(storagePath))
    , m_workItemRepository(std::make_unique<FileWorkItemRepository>(m_storage))
    , m_availabilityRepository(std::make_unique<FileAvailabilityRepository>(m_storage))
    , m_assignmentRepository(std::make_unique<FileAssignmentRepository>(m_storage))
{
}

DataProvider::~DataProvider() = default;

WorkItemRepository &DataProvider::workItemRepository()
{
    return *m_workItemRepository;
}

AvailabilityRepository &DataProvider::availabilityRepository()
{
    return *m_availabilityRepository;
}

AssignmentRepository &DataProvider::assignmentRepository()
{
    return *m_assignmentRepository;
}

} // namespace data
} // namespace timebox
