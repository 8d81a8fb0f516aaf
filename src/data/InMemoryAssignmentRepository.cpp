#include "timebox/data/InMemoryAssignmentRepository.hpp"

#include <algorithm>

namespace timebox {
namespace data {

InMemoryAssignmentRepository::InMemoryAssignmentRepository() = default;
InMemoryAssignmentRepository::~InMemoryAssignmentRepository() = default;

std::vector<Assignment> InMemoryAssignmentRepository::fetchAssignments() const
{
    std::vector<Assignment> assignments;
    assignments.reserve(static_cast<size_t>(m_assignments.size()));
    for (const auto &assignment : m_assignments) {
        assignments.push_back(assignment);
    }
    std::sort(assignments.begin(), assignments.end(), [](const Assignment &lhs, const Assignment &rhs) {
        if (lhs.start == rhs.start) {
            return lhs.priority < rhs.priority;
        }
        return lhs.start < rhs.start;
    });
    return assignments;
}

std::vector<Assignment> InMemoryAssignmentRepository::fetchAssignments(const QDate &from, const QDate &to) const
{
    std::vector<Assignment> assignments;
    for (const auto &assignment : fetchAssignments()) {
        if (assignment.end.date() < from || assignment.start.date() > to) {
            continue;
        }
        assignments.push_back(assignment);
    }
    return assignments;
}

std::optional<Assignment> InMemoryAssignmentRepository::findById(const QUuid &id) const
{
    if (m_assignments.contains(id)) {
        return m_assignments.value(id);
    }
    return std::nullopt;
}

bool InMemoryAssignmentRepository::addAssignments(const std::vector<Assignment> &assignments)
{
    for (auto assignment : assignments) {
        if (assignment.id.isNull()) {
            assignment.id = QUuid::createUuid();
        }
        m_assignments.insert(assignment.id, assignment);
    }
    return true;
}

bool InMemoryAssignmentRepository::updateAssignment(const Assignment &assignment)
{
    if (!m_assignments.contains(assignment.id)) {
        return false;
    }
    m_assignments.insert(assignment.id, assignment);
    return true;
}

bool InMemoryAssignmentRepository::clearOpenAssignments()
{
    for (auto it = m_assignments.begin(); it != m_assignments.end();) {
        if (it.value().status != AssignmentStatus::Completed) {
            it = m_assignments.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

bool InMemoryAssignmentRepository::replaceOpenAssignments(const std::vector<Assignment> &assignments)
{
    clearOpenAssignments();
    return addAssignments(assignments);
}

bool InMemoryAssignmentRepository::removeOpenAssignmentsFor(const QUuid &workItemId)
{
    for (auto it = m_assignments.begin(); it != m_assignments.end();) {
        if (it.value().workItemId == workItemId && it.value().status != AssignmentStatus::Completed) {
            it = m_assignments.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

} // namespace data
} // namespace timebox
