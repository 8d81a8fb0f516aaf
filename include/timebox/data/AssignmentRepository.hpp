#pragma once

#include <QDate>
#include <optional>
#include <vector>

#include "timebox/data/Assignment.hpp"

namespace timebox {
namespace data {

// Mutators return false when the records could not be written; nothing is changed then.
class AssignmentRepository
{
public:
    virtual ~AssignmentRepository() = default;

    // Ordered by start.
    virtual std::vector<Assignment> fetchAssignments() const = 0;
    virtual std::vector<Assignment> fetchAssignments(const QDate &from, const QDate &to) const = 0;
    virtual std::optional<Assignment> findById(const QUuid &id) const = 0;
    virtual bool addAssignments(const std::vector<Assignment> &assignments) = 0;
    virtual bool updateAssignment(const Assignment &assignment) = 0;

    // Removes every assignment that is not completed.
    virtual bool clearOpenAssignments() = 0;
    // Replaces every assignment that is not completed with @p assignments.
    virtual bool replaceOpenAssignments(const std::vector<Assignment> &assignments) = 0;
    virtual bool removeOpenAssignmentsFor(const QUuid &workItemId) = 0;
};

} // namespace data
} // namespace timebox
