#pragma once

#include <QHash>

#include "timebox/data/AvailabilityRepository.hpp"

namespace timebox {
namespace data {

class InMemoryAvailabilityRepository : public AvailabilityRepository
{
public:
    InMemoryAvailabilityRepository();
    ~InMemoryAvailabilityRepository() override;

    std::vector<AvailabilityRule> fetchRules() const override;
    std::optional<AvailabilityRule> findById(const QUuid &id) const override;
    AvailabilityRule addRule(AvailabilityRule rule) override;
    bool updateRule(const AvailabilityRule &rule) override;
    bool removeRule(const QUuid &id) override;

private:
    QHash<QUuid, AvailabilityRule> m_rules;
    QList<QUuid> m_order;
};

} // namespace data
} // namespace timebox
