#pragma once

#include <optional>
#include <vector>

#include "timebox/data/AvailabilityRule.hpp"

namespace timebox {
namespace data {

class AvailabilityRepository
{
public:
    virtual ~AvailabilityRepository() = default;

    virtual std::vector<AvailabilityRule> fetchRules() const = 0;
    virtual std::optional<AvailabilityRule> findById(const QUuid &id) const = 0;
    virtual AvailabilityRule addRule(AvailabilityRule rule) = 0;
    virtual bool updateRule(const AvailabilityRule &rule) = 0;
    virtual bool removeRule(const QUuid &id) = 0;
};

} // namespace data
} // namespace timebox
