#pragma once

#include <vector>

#include <QSet>
#include <QString>
#include <QStringList>
#include <QUuid>

#include "cadence/core/ReconcilerSettings.hpp"
#include "cadence/data/SeriesTemplate.hpp"

namespace cadence {
namespace core {

class SlugAllocator;

// The explicit "now" of a reconciliation call plus what the store already
// knows about identifiers outside the series at hand.
struct ReconcileContext
{
    QString today;
    QSet<QString> takenSlugs;
};

struct CreateInstanceCommand
{
    QUuid seriesId;
    QString instanceDate;
    QString slug;
};

// What the reconciler needs to know about an instance the store already holds.
struct ExistingInstance
{
    QUuid id;
    QString instanceDate;
    QString slug;
    bool hasRegistrations = false;
    bool isException = false;
};

struct RegenerationPlan
{
    std::vector<QUuid> deleteIds;
    std::vector<CreateInstanceCommand> creates;

    QStringList createDates() const;
};

// Turns a series template plus the store's current view of it into
// create/delete directives. Pure: nothing is read from or written to a store,
// so every call may be retried and converges on the same set of instances.
class SeriesReconciler
{
public:
    explicit SeriesReconciler(ReconcilerSettings settings = {});

    const ReconcilerSettings &settings() const;

    // First batch for a fresh series, up to initialHorizonMonths after today.
    std::vector<CreateInstanceCommand> reconcileInitial(const data::SeriesTemplate &series,
                                                        const ReconcileContext &context) const;

    // Continues after the latest materialized date up to extendHorizonMonths
    // after today. Dates in existingDates are never created again.
    std::vector<CreateInstanceCommand> reconcileExtend(const data::SeriesTemplate &series,
                                                       const QSet<QString> &existingDates,
                                                       const ReconcileContext &context) const;

    // Rebuilds the future of the series from the current template. Instances
    // with registrations or exception content are never deleted and their
    // dates are never created again.
    RegenerationPlan reconcileRegenerate(const data::SeriesTemplate &series,
                                         const std::vector<ExistingInstance> &existing,
                                         const ReconcileContext &context) const;

    // Instances that take over edited template content: today or later, not exceptions.
    std::vector<QUuid> reconcileContentUpdate(const std::vector<ExistingInstance> &existing,
                                              const ReconcileContext &context) const;

    // Instances to drop together with their series: today or later, no
    // registrations, not exceptions.
    std::vector<QUuid> reconcileDeletion(const std::vector<ExistingInstance> &existing,
                                         const ReconcileContext &context) const;

private:
    QStringList occurrencesFrom(const data::SeriesTemplate &series, const QString &from, const QString &horizon) const;
    std::vector<CreateInstanceCommand> toCommands(const data::SeriesTemplate &series,
                                                  const QStringList &occurrences,
                                                  SlugAllocator &slugs) const;

    ReconcilerSettings m_settings;
};

} // namespace core
} // namespace cadence
