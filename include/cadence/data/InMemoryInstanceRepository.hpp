#pragma once

#include <QHash>

#include "cadence/data/InstanceRepository.hpp"

namespace cadence {
namespace data {

class InMemoryInstanceRepository : public InstanceRepository
{
public:
    InMemoryInstanceRepository();
    ~InMemoryInstanceRepository() override;

    std::vector<EventInstance> fetchInstances(const QUuid &seriesId) const override;
    std::optional<EventInstance> findById(const QUuid &id) const override;
    std::optional<EventInstance> findBySlug(const QString &slug) const override;
    QSet<QString> slugs() const override;
    EventInstance addInstance(EventInstance instance) override;
    bool updateInstance(const EventInstance &instance) override;
    bool removeInstance(const QUuid &id) override;

private:
    QHash<QUuid, EventInstance> m_instances;
};

} // namespace data
} // namespace cadence
