#pragma once

#include "cadence/data/FileSeriesStorage.hpp"
#include "cadence/data/InstanceRepository.hpp"

#include <memory>

namespace cadence {
namespace data {

class FileInstanceRepository : public InstanceRepository
{
public:
    explicit FileInstanceRepository(std::shared_ptr<FileSeriesStorage> storage);
    ~FileInstanceRepository() override = default;

    std::vector<EventInstance> fetchInstances(const QUuid &seriesId) const override;
    std::optional<EventInstance> findById(const QUuid &id) const override;
    std::optional<EventInstance> findBySlug(const QString &slug) const override;
    QSet<QString> slugs() const override;
    EventInstance addInstance(EventInstance instance) override;
    bool updateInstance(const EventInstance &instance) override;
    bool removeInstance(const QUuid &id) override;

private:
    std::shared_ptr<FileSeriesStorage> m_storage;
};

} // namespace data
} // namespace cadence
