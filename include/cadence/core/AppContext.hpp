#pragma once

#include <memory>

#include <QString>

#include "cadence/core/ReconcilerSettings.hpp"

namespace cadence {
namespace data {
class DataProvider;
class SeriesRepository;
class InstanceRepository;
}

namespace core {

class SeriesService;

class AppContext
{
public:
    explicit AppContext(const QString &storagePath = QString(), ReconcilerSettings settings = {});
    ~AppContext();

    const QString &storagePath() const;
    data::SeriesRepository &seriesRepository();
    data::InstanceRepository &instanceRepository();
    SeriesService &seriesService();

private:
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<SeriesService> m_seriesService;
};

} // namespace core
} // namespace cadence
