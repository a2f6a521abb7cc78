#pragma once

#include <QHash>

#include "cadence/data/SeriesRepository.hpp"

namespace cadence {
namespace data {

class InMemorySeriesRepository : public SeriesRepository
{
public:
    InMemorySeriesRepository();
    ~InMemorySeriesRepository() override;

    std::vector<SeriesTemplate> fetchSeries() const override;
    std::optional<SeriesTemplate> findById(const QUuid &id) const override;
    SeriesTemplate addSeries(SeriesTemplate series) override;
    bool updateSeries(const SeriesTemplate &series) override;
    bool removeSeries(const QUuid &id) override;

private:
    QHash<QUuid, SeriesTemplate> m_series;
};

} // namespace data
} // namespace cadence
