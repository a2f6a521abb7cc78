#pragma once

#include <optional>
#include <vector>

#include "cadence/data/SeriesTemplate.hpp"

namespace cadence {
namespace data {

class SeriesRepository
{
public:
    virtual ~SeriesRepository() = default;

    virtual std::vector<SeriesTemplate> fetchSeries() const = 0;
    virtual std::optional<SeriesTemplate> findById(const QUuid &id) const = 0;
    virtual SeriesTemplate addSeries(SeriesTemplate series) = 0;
    virtual bool updateSeries(const SeriesTemplate &series) = 0;
    virtual bool removeSeries(const QUuid &id) = 0;
};

} // namespace data
} // namespace cadence
