#include "cadence/data/InMemorySeriesRepository.hpp"

#include <algorithm>

namespace cadence {
namespace data {

InMemorySeriesRepository::InMemorySeriesRepository() = default;
InMemorySeriesRepository::~InMemorySeriesRepository() = default;

std::vector<SeriesTemplate> InMemorySeriesRepository::fetchSeries() const
{
    std::vector<SeriesTemplate> series;
    series.reserve(static_cast<size_t>(m_series.size()));
    for (const auto &item : m_series) {
        series.push_back(item);
    }
    std::sort(series.begin(), series.end(), [](const SeriesTemplate &lhs, const SeriesTemplate &rhs) {
        return lhs.startDate < rhs.startDate;
    });
    return series;
}

std::optional<SeriesTemplate> InMemorySeriesRepository::findById(const QUuid &id) const
{
    if (m_series.contains(id)) {
        return m_series.value(id);
    }
    return std::nullopt;
}

SeriesTemplate InMemorySeriesRepository::addSeries(SeriesTemplate series)
{
    if (series.id.isNull()) {
        series.id = QUuid::createUuid();
    }
    m_series.insert(series.id, series);
    return series;
}

bool InMemorySeriesRepository::updateSeries(const SeriesTemplate &series)
{
    if (!m_series.contains(series.id)) {
        return false;
    }
    m_series.insert(series.id, series);
    return true;
}

bool InMemorySeriesRepository::removeSeries(const QUuid &id)
{
    return m_series.remove(id) > 0;
}

} // namespace data
} // namespace cadence
