#include "timebox/data/InMemoryAvailabilityRepository.hpp"

namespace timebox {
namespace data {

InMemoryAvailabilityRepository::InMemoryAvailabilityRepository() = default;
InMemoryAvailabilityRepository::~InMemoryAvailabilityRepository() = default;

std::vector<AvailabilityRule> InMemoryAvailabilityRepository::fetchRules() const
{
    std::vector<AvailabilityRule> rules;
    rules.reserve(static_cast<size_t>(m_order.size()));
    for (const auto &id : m_order) {
        rules.push_back(m_rules.value(id));
    }
    return rules;
}

std::optional<AvailabilityRule> InMemoryAvailabilityRepository::findById(const QUuid &id) const
{
    if (m_rules.contains(id)) {
        return m_rules.value(id);
    }
    return std::nullopt;
}

AvailabilityRule InMemoryAvailabilityRepository::addRule(AvailabilityRule rule)
{
    if (rule.id.isNull()) {
        rule.id = QUuid::createUuid();
    }
    if (!m_rules.contains(rule.id)) {
        m_order.append(rule.id);
    }
    m_rules.insert(rule.id, rule);
    return rule;
}

bool InMemoryAvailabilityRepository::updateRule(const AvailabilityRule &rule)
{
    if (!m_rules.contains(rule.id)) {
        return false;
    }
    m_rules.insert(rule.id, rule);
    return true;
}

bool InMemoryAvailabilityRepository::removeRule(const QUuid &id)
{
    m_order.removeAll(id);
    return m_rules.remove(id) > 0;
}

} // namespace data
} // namespace timebox
