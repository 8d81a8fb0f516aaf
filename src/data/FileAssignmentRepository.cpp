#include "timebox/data/FileAssignmentRepository.hpp"

#include <algorithm>

namespace timebox {
namespace data {

namespace {
bool isOpen(const Assignment &assignment)
{
    return assignment.status != AssignmentStatus::Completed;
}
} // namespace

FileAssignmentRepository::FileAssignmentRepository(std::shared_ptr<FileScheduleStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Assignment> FileAssignmentRepository::fetchAssignments() const
{
    std::vector<Assignment> result;
    if (!m_storage) {
        return result;
    }
    const auto &assignments = m_storage->assignments();
    result.reserve(static_cast<size_t>(assignments.size()));
    for (auto it = assignments.constBegin(); it != assignments.constEnd(); ++it) {
        result.push_back(it.value());
    }
    std::sort(result.begin(), result.end(), [](const Assignment &lhs, const Assignment &rhs) {
        if (lhs.start == rhs.start) {
            return lhs.priority < rhs.priority;
        }
        return lhs.start < rhs.start;
    });
    return result;
}

std::vector<Assignment> FileAssignmentRepository::fetchAssignments(const QDate &from, const QDate &to) const
{
    std::vector<Assignment> result;
    for (const auto &assignment : fetchAssignments()) {
        if (assignment.end.date() < from || assignment.start.date() > to) {
            continue;
        }
        result.push_back(assignment);
    }
    return result;
}

std::optional<Assignment> FileAssignmentRepository::findById(const QUuid &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &assignments = m_storage->assignments();
    if (assignments.contains(id)) {
        return assignments.value(id);
    }
    return std::nullopt;
}

bool FileAssignmentRepository::addAssignments(const std::vector<Assignment> &assignments)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->storeAssignments(assignments);
}

bool FileAssignmentRepository::updateAssignment(const Assignment &assignment)
{
    if (!m_storage) {
        return false;
    }
    if (!m_storage->assignments().contains(assignment.id)) {
        return false;
    }
    return m_storage->storeAssignments({ assignment });
}

bool FileAssignmentRepository::clearOpenAssignments()
{
    if (!m_storage) {
        return false;
    }
    return m_storage->replaceAssignments(isOpen, {});
}

bool FileAssignmentRepository::replaceOpenAssignments(const std::vector<Assignment> &assignments)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->replaceAssignments(isOpen, assignments);
}

bool FileAssignmentRepository::removeOpenAssignmentsFor(const QUuid &workItemId)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->replaceAssignments(
        [&](const Assignment &assignment) { return assignment.workItemId == workItemId && isOpen(assignment); }, {});
}

} // namespace data
} // namespace timebox
