#include "cadence/core/SeriesReconciler.hpp"

#include "cadence/core/DateMath.hpp"
#include "cadence/core/Logging.hpp"
#include "cadence/core/OccurrenceGenerator.hpp"
#include "cadence/core/Slug.hpp"

#include <algorithm>

namespace cadence {
namespace core {

namespace {

bool checkInputs(const data::SeriesTemplate &series, const ReconcileContext &context)
{
    QString error;
    if (!series.isValid(&error)) {
        qCWarning(lcCadenceReconciler) << "series" << series.id << "is invalid:" << error;
        return false;
    }
    if (!dates::isValid(context.today)) {
        qCWarning(lcCadenceReconciler) << "invalid reconciliation date" << context.today;
        return false;
    }
    return true;
}

bool isUpcoming(const ExistingInstance &instance, const QString &today)
{
    return dates::compare(instance.instanceDate, today) >= 0;
}

// Latest date not after `from` at which generation can resume without
// breaking the series' week parity.
QString alignedAnchor(const RecurrenceRule &rule, const QString &seriesStart, const QString &from)
{
    if (!rule.isWeeklyClass()) {
        return from;
    }
    const qint64 step = 7 * rule.weekInterval();
    if (rule.daysOfWeek().isEmpty()) {
        const qint64 periods = dates::daysBetween(seriesStart, from) / step;
        return dates::addDays(seriesStart, static_cast<int>(periods * step));
    }
    const QString firstWeek = dates::startOfWeek(seriesStart);
    const qint64 periods = dates::daysBetween(firstWeek, dates::startOfWeek(from)) / step;
    return dates::latest(seriesStart, dates::addDays(firstWeek, static_cast<int>(periods * step)));
}

} // namespace

QStringList RegenerationPlan::createDates() const
{
    QStringList result;
    result.reserve(static_cast<int>(creates.size()));
    for (const auto &command : creates) {
        result << command.instanceDate;
    }
    return result;
}

SeriesReconciler::SeriesReconciler(ReconcilerSettings settings)
    : m_settings(settings)
{
}

const ReconcilerSettings &SeriesReconciler::settings() const
{
    return m_settings;
}

QStringList SeriesReconciler::occurrencesFrom(const data::SeriesTemplate &series,
                                              const QString &from,
                                              const QString &horizon) const
{
    // A count limit is counted from the first occurrence of the series, so
    // those series always generate from their start.
    QString anchor = series.startDate;
    if (!series.maxOccurrences && dates::compare(from, series.startDate) > 0) {
        anchor = alignedAnchor(series.rule, series.startDate, from);
    }

    GenerationBounds bounds;
    bounds.startDate = anchor;
    bounds.endDate = series.endDate;
    bounds.maxOccurrences = series.maxOccurrences;
    bounds.generateUntil = horizon;

    QStringList occurrences = OccurrenceGenerator(series.rule).generate(bounds);
    occurrences.erase(std::remove_if(occurrences.begin(), occurrences.end(),
                                     [&from](const QString &date) { return dates::compare(date, from) < 0; }),
                      occurrences.end());
    return occurrences;
}

std::vector<CreateInstanceCommand> SeriesReconciler::toCommands(const data::SeriesTemplate &series,
                                                                const QStringList &occurrences,
                                                                SlugAllocator &slugs) const
{
    const QString base = slugify(series.name);
    std::vector<CreateInstanceCommand> commands;
    commands.reserve(static_cast<size_t>(occurrences.size()));
    for (const QString &date : occurrences) {
        CreateInstanceCommand command;
        command.seriesId = series.id;
        command.instanceDate = date;
        command.slug = slugs.allocate(base, date);
        commands.push_back(std::move(command));
    }
    return commands;
}

std::vector<CreateInstanceCommand> SeriesReconciler::reconcileInitial(const data::SeriesTemplate &series,
                                                                      const ReconcileContext &context) const
{
    if (!checkInputs(series, context)) {
        return {};
    }
    const QString horizon = dates::addMonths(context.today, m_settings.initialHorizonMonths);
    const QStringList occurrences = occurrencesFrom(series, series.startDate, horizon);

    SlugAllocator slugs(context.takenSlugs);
    auto commands = toCommands(series, occurrences, slugs);
    qCInfo(lcCadenceReconciler) << "initial materialization of" << series.name << "through" << horizon << ":"
                                << commands.size() << "instances";
    return commands;
}

std::vector<CreateInstanceCommand> SeriesReconciler::reconcileExtend(const data::SeriesTemplate &series,
                                                                     const QSet<QString> &existingDates,
                                                                     const ReconcileContext &context) const
{
    if (!checkInputs(series, context)) {
        return {};
    }

    QString from = series.startDate;
    for (const QString &date : existingDates) {
        if (dates::isValid(date)) {
            from = dates::latest(from, date);
        }
    }
    const QString horizon = dates::addMonths(context.today, m_settings.extendHorizonMonths);

    QStringList occurrences = occurrencesFrom(series, from, horizon);
    occurrences.erase(std::remove_if(occurrences.begin(), occurrences.end(),
                                     [&existingDates](const QString &date) { return existingDates.contains(date); }),
                      occurrences.end());

    SlugAllocator slugs(context.takenSlugs);
    auto commands = toCommands(series, occurrences, slugs);
    qCInfo(lcCadenceReconciler) << "extended" << series.name << "from" << from << "through" << horizon << ":"
                                << commands.size() << "new instances";
    return commands;
}

RegenerationPlan SeriesReconciler::reconcileRegenerate(const data::SeriesTemplate &series,
                                                       const std::vector<ExistingInstance> &existing,
                                                       const ReconcileContext &context) const
{
    RegenerationPlan plan;
    if (!checkInputs(series, context)) {
        return plan;
    }

    SlugAllocator slugs(context.takenSlugs);
    QSet<QString> remainingDates;
    for (const auto &instance : existing) {
        const bool deletable = isUpcoming(instance, context.today) && !instance.hasRegistrations
            && !instance.isException;
        if (deletable) {
            plan.deleteIds.push_back(instance.id);
            slugs.release(instance.slug);
        } else {
            remainingDates.insert(instance.instanceDate);
            slugs.reserve(instance.slug);
        }
    }

    const QString horizon = dates::addMonths(context.today, m_settings.regenerateHorizonMonths);
    QStringList occurrences = occurrencesFrom(series, context.today, horizon);
    occurrences.erase(std::remove_if(occurrences.begin(), occurrences.end(),
                                     [&remainingDates](const QString &date) { return remainingDates.contains(date); }),
                      occurrences.end());

    plan.creates = toCommands(series, occurrences, slugs);
    qCInfo(lcCadenceReconciler) << "regenerated" << series.name << "from" << context.today << ":"
                                << plan.deleteIds.size() << "deleted," << plan.creates.size() << "created";
    return plan;
}

std::vector<QUuid> SeriesReconciler::reconcileContentUpdate(const std::vector<ExistingInstance> &existing,
                                                            const ReconcileContext &context) const
{
    std::vector<QUuid> ids;
    if (!dates::isValid(context.today)) {
        qCWarning(lcCadenceReconciler) << "invalid reconciliation date" << context.today;
        return ids;
    }
    for (const auto &instance : existing) {
        if (isUpcoming(instance, context.today) && !instance.isException) {
            ids.push_back(instance.id);
        }
    }
    return ids;
}

std::vector<QUuid> SeriesReconciler::reconcileDeletion(const std::vector<ExistingInstance> &existing,
                                                       const ReconcileContext &context) const
{
    std::vector<QUuid> ids;
    if (!dates::isValid(context.today)) {
        qCWarning(lcCadenceReconciler) << "invalid reconciliation date" << context.today;
        return ids;
    }
    for (const auto &instance : existing) {
        if (isUpcoming(instance, context.today) && !instance.hasRegistrations && !instance.isException) {
            ids.push_back(instance.id);
        }
    }
    return ids;
}

} // namespace core
} // namespace cadence
