#include "cadence/core/AppContext.hpp"

#include "cadence/data/DataProvider.hpp"

#include "cadence/core/SeriesService.hpp"

namespace cadence {
namespace core {

AppContext::AppContext(const QString &storagePath, ReconcilerSettings settings)
    : m_dataProvider(std::make_unique<data::DataProvider>(storagePath))
    , m_seriesService(std::make_unique<SeriesService>(m_dataProvider->seriesRepository(),
                                                      m_dataProvider->instanceRepository(),
                                                      SeriesReconciler(settings)))
{
}

AppContext::~AppContext() = default;

const QString &AppContext::storagePath() const
{
    return m_dataProvider->storagePath();
}

data::SeriesRepository &AppContext::seriesRepository()
{
    return m_dataProvider->seriesRepository();
}

data::InstanceRepository &AppContext::instanceRepository()
{
    return m_dataProvider->instanceRepository();
}

SeriesService &AppContext::seriesService()
{
    return *m_seriesService;
}

} // namespace core
} // namespace cadence
