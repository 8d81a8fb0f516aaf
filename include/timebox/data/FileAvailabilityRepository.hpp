#pragma once

#include "timebox/data/AvailabilityRepository.hpp"
#include "timebox/data/FileScheduleStorage.hpp"

#include <memory>

namespace timebox {
namespace data {

class FileAvailabilityRepository : public AvailabilityRepository
{
public:
    explicit FileAvailabilityRepository(std::shared_ptr<FileScheduleStorage> storage);
    ~FileAvailabilityRepository() override = default;

    std::vector<AvailabilityRule> fetchRules() const override;
    std::optional<AvailabilityRule> findById(const QUuid &id) const override;
    AvailabilityRule addRule(AvailabilityRule rule) override;
    bool updateRule(const AvailabilityRule &rule) override;
    bool removeRule(const QUuid &id) override;

private:
    std::shared_ptr<FileScheduleStorage> m_storage;
};

} // namespace data
} // namespace timebox
