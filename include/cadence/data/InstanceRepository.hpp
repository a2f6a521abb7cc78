#pragma once

#include <optional>
#include <vector>

#include <QSet>

#include "cadence/data/EventInstance.hpp"

namespace cadence {
namespace data {

class InstanceRepository
{
public:
    virtual ~InstanceRepository() = default;

    // Ordered by instance date.
    virtual std::vector<EventInstance> fetchInstances(const QUuid &seriesId) const = 0;
    virtual std::optional<EventInstance> findById(const QUuid &id) const = 0;
    virtual std::optional<EventInstance> findBySlug(const QString &slug) const = 0;
    virtual QSet<QString> slugs() const = 0;
    virtual EventInstance addInstance(EventInstance instance) = 0;
    virtual bool updateInstance(const EventInstance &instance) = 0;
    virtual bool removeInstance(const QUuid &id) = 0;
};

} // namespace data
} // namespace cadence
