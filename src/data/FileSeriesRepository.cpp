#include "cadence/data/FileSeriesRepository.hpp"

#include <algorithm>

namespace cadence {
namespace data {

FileSeriesRepository::FileSeriesRepository(std::shared_ptr<FileSeriesStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<SeriesTemplate> FileSeriesRepository::fetchSeries() const
{
    std::vector<SeriesTemplate> result;
    if (!m_storage) {
        return result;
    }

    const auto &series = m_storage->series();
    result.reserve(static_cast<size_t>(series.size()));
    for (auto it = series.constBegin(); it != series.constEnd(); ++it) {
        result.push_back(it.value());
    }
    std::sort(result.begin(), result.end(), [](const SeriesTemplate &lhs, const SeriesTemplate &rhs) {
        if (lhs.startDate == rhs.startDate) {
            return lhs.name < rhs.name;
        }
        return lhs.startDate < rhs.startDate;
    });
    return result;
}

std::optional<SeriesTemplate> FileSeriesRepository::findById(const QUuid &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &series = m_storage->series();
    if (series.contains(id)) {
        return series.value(id);
    }
    return std::nullopt;
}

SeriesTemplate FileSeriesRepository::addSeries(SeriesTemplate series)
{
    if (!m_storage) {
        return series;
    }
    return m_storage->addOrUpdateSeries(std::move(series));
}

bool FileSeriesRepository::updateSeries(const SeriesTemplate &series)
{
    if (!m_storage || !m_storage->series().contains(series.id)) {
        return false;
    }
    m_storage->addOrUpdateSeries(series);
    return true;
}

bool FileSeriesRepository::removeSeries(const QUuid &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeSeries(id);
}

} // namespace data
} // namespace cadence
