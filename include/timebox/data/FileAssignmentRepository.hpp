#pragma once

#include "timebox/data/AssignmentRepository.hpp"
#include "timebox/data/FileScheduleStorage.hpp"

#include <memory>

namespace timebox {
namespace data {

class FileAssignmentRepository : public AssignmentRepository
{
public:
    explicit FileAssignmentRepository(std::shared_ptr<FileScheduleStorage> storage);
    ~FileAssignmentRepository() override = default;

    std::vector<Assignment> fetchAssignments() const override;
    std::vector<Assignment> fetchAssignments(const QDate &from, const QDate &to) const override;
    std::optional<Assignment> findById(const QUuid &id) const override;
    bool addAssignments(const std::vector<Assignment> &assignments) override;
    bool updateAssignment(const Assignment &assignment) override;
    bool clearOpenAssignments() override;
    bool replaceOpenAssignments(const std::vector<Assignment> &assignments) override;
    bool removeOpenAssignmentsFor(const QUuid &workItemId) override;

private:
    std::shared_ptr<FileScheduleStorage> m_storage;
};

} // namespace data
} // namespace timebox
