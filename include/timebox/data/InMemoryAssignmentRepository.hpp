#pragma once

#include <QHash>

#include "timebox/data/AssignmentRepository.hpp"

namespace timebox {
namespace data {

class InMemoryAssignmentRepository : public AssignmentRepository
{
public:
    InMemoryAssignmentRepository();
    ~InMemoryAssignmentRepository() override;

    std::vector<Assignment> fetchAssignments() const override;
    std::vector<Assignment> fetchAssignments(const QDate &from, const QDate &to) const override;
    std::optional<Assignment> findById(const QUuid &id) const override;
    bool addAssignments(const std::vector<Assignment> &assignments) override;
    bool updateAssignment(const Assignment &assignment) override;
    bool clearOpenAssignments() override;
    bool replaceOpenAssignments(const std::vector<Assignment> &assignments) override;
    bool removeOpenAssignmentsFor(const QUuid &workItemId) override;

private:
    QHash<QUuid, Assignment> m_assignments;
};

} // namespace data
} // namespace timebox
