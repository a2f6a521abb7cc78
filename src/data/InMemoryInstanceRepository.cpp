#include "cadence/data/InMemoryInstanceRepository.hpp"

#include <algorithm>

namespace cadence {
namespace data {

InMemoryInstanceRepository::InMemoryInstanceRepository() = default;
InMemoryInstanceRepository::~InMemoryInstanceRepository() = default;

std::vector<EventInstance> InMemoryInstanceRepository::fetchInstances(const QUuid &seriesId) const
{
    std::vector<EventInstance> instances;
    for (const auto &instance : m_instances) {
        if (instance.seriesId == seriesId) {
            instances.push_back(instance);
        }
    }
    std::sort(instances.begin(), instances.end(), [](const EventInstance &lhs, const EventInstance &rhs) {
        return lhs.instanceDate < rhs.instanceDate;
    });
    return instances;
}

std::optional<EventInstance> InMemoryInstanceRepository::findById(const QUuid &id) const
{
    if (m_instances.contains(id)) {
        return m_instances.value(id);
    }
    return std::nullopt;
}

std::optional<EventInstance> InMemoryInstanceRepository::findBySlug(const QString &slug) const
{
    for (const auto &instance : m_instances) {
        if (instance.slug == slug) {
            return instance;
        }
    }
    return std::nullopt;
}

QSet<QString> InMemoryInstanceRepository::slugs() const
{
    QSet<QString> result;
    for (const auto &instance : m_instances) {
        result.insert(instance.slug);
    }
    return result;
}

EventInstance InMemoryInstanceRepository::addInstance(EventInstance instance)
{
    if (instance.id.isNull()) {
        instance.id = QUuid::createUuid();
    }
    m_instances.insert(instance.id, instance);
    return instance;
}

bool InMemoryInstanceRepository::updateInstance(const EventInstance &instance)
{
    if (!m_instances.contains(instance.id)) {
        return false;
    }
    m_instances.insert(instance.id, instance);
    return true;
}

bool InMemoryInstanceRepository::removeInstance(const QUuid &id)
{
    return m_instances.remove(id) > 0;
}

} // namespace data
} // namespace cadence
