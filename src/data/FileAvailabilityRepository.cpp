#include "timebox/data/FileAvailabilityRepository.hpp"

#include "timebox/core/Logging.hpp"

namespace timebox {
namespace data {

FileAvailabilityRepository::FileAvailabilityRepository(std::shared_ptr<FileScheduleStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<AvailabilityRule> FileAvailabilityRepository::fetchRules() const
{
    std::vector<AvailabilityRule> result;
    if (!m_storage) {
        return result;
    }
    const auto &rules = m_storage->rules();
    for (const QUuid &id : m_storage->ruleOrder()) {
        result.push_back(rules.value(id));
    }
    return result;
}

std::optional<AvailabilityRule> FileAvailabilityRepository::findById(const QUuid &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &rules = m_storage->rules();
    if (rules.contains(id)) {
        return rules.value(id);
    }
    return std::nullopt;
}

AvailabilityRule FileAvailabilityRepository::addRule(AvailabilityRule rule)
{
    if (rule.id.isNull()) {
        rule.id = QUuid::createUuid();
    }
    if (m_storage && !m_storage->storeRule(rule)) {
        qCWarning(lcData).noquote() << "Availability rule" << rule.name << "was not saved";
    }
    return rule;
}

bool FileAvailabilityRepository::updateRule(const AvailabilityRule &rule)
{
    if (!m_storage) {
        return false;
    }
    if (!m_storage->rules().contains(rule.id)) {
        return false;
    }
    return m_storage->storeRule(rule);
}

bool FileAvailabilityRepository::removeRule(const QUuid &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeRule(id);
}

} // namespace data
} // namespace timebox
