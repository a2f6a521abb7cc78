#include "cadence/data/FileInstanceRepository.hpp"

#include <algorithm>

namespace cadence {
namespace data {

FileInstanceRepository::FileInstanceRepository(std::shared_ptr<FileSeriesStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<EventInstance> FileInstanceRepository::fetchInstances(const QUuid &seriesId) const
{
    std::vector<EventInstance> result;
    if (!m_storage) {
        return result;
    }

    const auto &instances = m_storage->instances();
    for (auto it = instances.constBegin(); it != instances.constEnd(); ++it) {
        if (it.value().seriesId == seriesId) {
            result.push_back(it.value());
        }
    }
    std::sort(result.begin(), result.end(), [](const EventInstance &lhs, const EventInstance &rhs) {
        return lhs.instanceDate < rhs.instanceDate;
    });
    return result;
}

std::optional<EventInstance> FileInstanceRepository::findById(const QUuid &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &instances = m_storage->instances();
    if (instances.contains(id)) {
        return instances.value(id);
    }
    return std::nullopt;
}

std::optional<EventInstance> FileInstanceRepository::findBySlug(const QString &slug) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    for (const auto &instance : m_storage->instances()) {
        if (instance.slug == slug) {
            return instance;
        }
    }
    return std::nullopt;
}

QSet<QString> FileInstanceRepository::slugs() const
{
    QSet<QString> result;
    if (!m_storage) {
        return result;
    }
    for (const auto &instance : m_storage->instances()) {
        result.insert(instance.slug);
    }
    return result;
}

EventInstance FileInstanceRepository::addInstance(EventInstance instance)
{
    if (!m_storage) {
        return instance;
    }
    return m_storage->addOrUpdateInstance(std::move(instance));
}

bool FileInstanceRepository::updateInstance(const EventInstance &instance)
{
    if (!m_storage || !m_storage->instances().contains(instance.id)) {
        return false;
    }
    m_storage->addOrUpdateInstance(instance);
    return true;
}

bool FileInstanceRepository::removeInstance(const QUuid &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeInstance(id);
}

} // namespace data
} // namespace cadence
