#pragma once

#include "cadence/data/FileSeriesStorage.hpp"
#include "cadence/data/SeriesRepository.hpp"

#include <memory>

namespace cadence {
namespace data {

class FileSeriesRepository : public SeriesRepository
{
public:
    explicit FileSeriesRepository(std::shared_ptr<FileSeriesStorage> storage);
    ~FileSeriesRepository() override = default;

    std::vector<SeriesTemplate> fetchSeries() const override;
    std::optional<SeriesTemplate> findById(const QUuid &id) const override;
    SeriesTemplate addSeries(SeriesTemplate series) override;
    bool updateSeries(const SeriesTemplate &series) override;
    bool removeSeries(const QUuid &id) override;

private:
    std::shared_ptr<FileSeriesStorage> m_storage;
};

} // namespace data
} // namespace cadence
