#pragma once

#include <vector>

#include <QString>
#include <QUuid>

#include "cadence/core/SeriesReconciler.hpp"
#include "cadence/data/EventInstance.hpp"
#include "cadence/data/SeriesTemplate.hpp"

namespace cadence {
namespace data {
class SeriesRepository;
class InstanceRepository;
}

namespace core {

struct SeriesActionResult
{
    bool success = false;
    QString message;
    int created = 0;
    int deleted = 0;
    int updated = 0;
};

// Runs the reconciler against the repositories and writes its directives
// back. `today` is the caller's notion of the current calendar date.
class SeriesService
{
public:
    SeriesService(data::SeriesRepository &seriesRepository,
                  data::InstanceRepository &instanceRepository,
                  SeriesReconciler reconciler = SeriesReconciler());

    const SeriesReconciler &reconciler() const;

    SeriesActionResult createSeries(data::SeriesTemplate series, const QString &today, QUuid *createdId = nullptr);
    SeriesActionResult generateMore(const QUuid &seriesId, const QString &today);
    SeriesActionResult regenerate(const QUuid &seriesId, const QString &today);
    // Stores the edited template and copies its content onto upcoming,
    // non-exception instances. Dates are left alone; see regenerate().
    SeriesActionResult updateSeries(const data::SeriesTemplate &series, const QString &today);
    SeriesActionResult setStatus(const QUuid &seriesId, data::SeriesStatus status);
    SeriesActionResult deleteSeries(const QUuid &seriesId, const QString &today);
    // generateMore() for every active series; paused and ended ones are skipped.
    SeriesActionResult extendActiveSeries(const QString &today);

private:
    std::vector<ExistingInstance> existingInstances(const QUuid &seriesId) const;
    ReconcileContext contextFor(const QString &today) const;
    int applyCreates(const data::SeriesTemplate &series, const std::vector<CreateInstanceCommand> &commands);

    data::SeriesRepository &m_seriesRepository;
    data::InstanceRepository &m_instanceRepository;
    SeriesReconciler m_reconciler;
};

void applyTemplateContent(const data::SeriesTemplate &series, data::EventInstance &instance);

} // namespace core
} // namespace cadence
