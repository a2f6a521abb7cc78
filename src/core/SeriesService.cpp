#include "cadence/core/SeriesService.hpp"

#include "cadence/core/Logging.hpp"
#include "cadence/core/Slug.hpp"
#include "cadence/data/InstanceRepository.hpp"
#include "cadence/data/SeriesRepository.hpp"

namespace cadence {
namespace core {

namespace {

SeriesActionResult failure(const QString &message)
{
    qCWarning(lcCadenceService) << message;
    SeriesActionResult result;
    result.message = message;
    return result;
}

SeriesActionResult seriesNotFound(const QUuid &seriesId)
{
    return failure(QStringLiteral("Series %1 not found").arg(seriesId.toString(QUuid::WithoutBraces)));
}

QString plural(int count, const char *noun)
{
    return QStringLiteral("%1 %2%3").arg(count).arg(QLatin1String(noun)).arg(count == 1 ? QString() : QStringLiteral("s"));
}

} // namespace

void applyTemplateContent(const data::SeriesTemplate &series, data::EventInstance &instance)
{
    instance.name = series.name;
    instance.description = series.description;
    instance.location = series.location;
    instance.timeStart = series.timeStart;
    instance.timeEnd = series.timeEnd;
    instance.capacity = series.capacity;
}

SeriesService::SeriesService(data::SeriesRepository &seriesRepository,
                             data::InstanceRepository &instanceRepository,
                             SeriesReconciler reconciler)
    : m_seriesRepository(seriesRepository)
    , m_instanceRepository(instanceRepository)
    , m_reconciler(std::move(reconciler))
{
}

const SeriesReconciler &SeriesService::reconciler() const
{
    return m_reconciler;
}

std::vector<ExistingInstance> SeriesService::existingInstances(const QUuid &seriesId) const
{
    std::vector<ExistingInstance> existing;
    for (const auto &instance : m_instanceRepository.fetchInstances(seriesId)) {
        ExistingInstance entry;
        entry.id = instance.id;
        entry.instanceDate = instance.instanceDate;
        entry.slug = instance.slug;
        entry.hasRegistrations = instance.hasRegistrations();
        entry.isException = instance.isException;
        existing.push_back(std::move(entry));
    }
    return existing;
}

ReconcileContext SeriesService::contextFor(const QString &today) const
{
    ReconcileContext context;
    context.today = today;
    context.takenSlugs = m_instanceRepository.slugs();
    return context;
}

int SeriesService::applyCreates(const data::SeriesTemplate &series, const std::vector<CreateInstanceCommand> &commands)
{
    const QString base = slugify(series.name);
    int created = 0;
    for (const auto &command : commands) {
        data::EventInstance instance;
        instance.seriesId = command.seriesId;
        instance.instanceDate = command.instanceDate;
        instance.slug = command.slug;
        if (m_instanceRepository.findBySlug(instance.slug)) {
            // Someone claimed the slug after the plan was made.
            SlugAllocator slugs(m_instanceRepository.slugs());
            instance.slug = slugs.allocate(base, command.instanceDate);
            qCInfo(lcCadenceService) << "slug" << command.slug << "collided, stored as" << instance.slug;
        }
        applyTemplateContent(series, instance);
        m_instanceRepository.addInstance(std::move(instance));
        ++created;
    }
    return created;
}

SeriesActionResult SeriesService::createSeries(data::SeriesTemplate series, const QString &today, QUuid *createdId)
{
    QString error;
    if (!series.isValid(&error)) {
        return failure(error);
    }
    series.status = data::SeriesStatus::Active;
    const auto stored = m_seriesRepository.addSeries(std::move(series));
    if (createdId) {
        *createdId = stored.id;
    }

    SeriesActionResult result;
    result.created = applyCreates(stored, m_reconciler.reconcileInitial(stored, contextFor(today)));
    result.success = true;
    result.message = QStringLiteral("Created series with %1").arg(plural(result.created, "instance"));
    qCInfo(lcCadenceService) << stored.name << ":" << result.message;
    return result;
}

SeriesActionResult SeriesService::generateMore(const QUuid &seriesId, const QString &today)
{
    const auto series = m_seriesRepository.findById(seriesId);
    if (!series) {
        return seriesNotFound(seriesId);
    }

    QSet<QString> existingDates;
    for (const auto &instance : m_instanceRepository.fetchInstances(seriesId)) {
        existingDates.insert(instance.instanceDate);
    }

    SeriesActionResult result;
    result.created = applyCreates(*series, m_reconciler.reconcileExtend(*series, existingDates, contextFor(today)));
    result.success = true;
    result.message = result.created > 0
        ? QStringLiteral("Generated %1").arg(plural(result.created, "new instance"))
        : QStringLiteral("No new instances needed (already generated or end reached)");
    qCInfo(lcCadenceService) << series->name << ":" << result.message;
    return result;
}

SeriesActionResult SeriesService::regenerate(const QUuid &seriesId, const QString &today)
{
    const auto series = m_seriesRepository.findById(seriesId);
    if (!series) {
        return seriesNotFound(seriesId);
    }

    const auto plan = m_reconciler.reconcileRegenerate(*series, existingInstances(seriesId), contextFor(today));

    SeriesActionResult result;
    for (const QUuid &id : plan.deleteIds) {
        if (m_instanceRepository.removeInstance(id)) {
            ++result.deleted;
        } else {
            qCWarning(lcCadenceService) << "instance" << id << "vanished before it could be deleted";
        }
    }
    result.created = applyCreates(*series, plan.creates);
    result.success = true;
    result.message = QStringLiteral("Regenerated instances: %1 deleted, %2 created").arg(result.deleted).arg(result.created);
    qCInfo(lcCadenceService) << series->name << ":" << result.message;
    return result;
}

SeriesActionResult SeriesService::updateSeries(const data::SeriesTemplate &series, const QString &today)
{
    const auto current = m_seriesRepository.findById(series.id);
    if (!current) {
        return seriesNotFound(series.id);
    }
    QString error;
    if (!series.isValid(&error)) {
        return failure(error);
    }
    if (!m_seriesRepository.updateSeries(series)) {
        return failure(QStringLiteral("Could not store series %1").arg(series.name));
    }

    SeriesActionResult result;
    const auto ids = m_reconciler.reconcileContentUpdate(existingInstances(series.id), contextFor(today));
    for (const QUuid &id : ids) {
        auto instance = m_instanceRepository.findById(id);
        if (!instance) {
            continue;
        }
        applyTemplateContent(series, *instance);
        if (m_instanceRepository.updateInstance(*instance)) {
            ++result.updated;
        }
    }
    result.success = true;
    result.message = QStringLiteral("Series updated");
    qCInfo(lcCadenceService) << series.name << ": updated," << result.updated << "upcoming instances refreshed";
    return result;
}

SeriesActionResult SeriesService::setStatus(const QUuid &seriesId, data::SeriesStatus status)
{
    auto series = m_seriesRepository.findById(seriesId);
    if (!series) {
        return seriesNotFound(seriesId);
    }
    series->status = status;
    if (!m_seriesRepository.updateSeries(*series)) {
        return failure(QStringLiteral("Could not store series %1").arg(series->name));
    }

    SeriesActionResult result;
    result.success = true;
    switch (status) {
    case data::SeriesStatus::Paused:
        result.message = QStringLiteral("Series paused");
        break;
    case data::SeriesStatus::Ended:
        result.message = QStringLiteral("Series ended");
        break;
    case data::SeriesStatus::Active:
    default:
        result.message = QStringLiteral("Series resumed");
        break;
    }
    qCInfo(lcCadenceService) << series->name << ":" << result.message;
    return result;
}

SeriesActionResult SeriesService::deleteSeries(const QUuid &seriesId, const QString &today)
{
    const auto series = m_seriesRepository.findById(seriesId);
    if (!series) {
        return seriesNotFound(seriesId);
    }

    SeriesActionResult result;
    const auto ids = m_reconciler.reconcileDeletion(existingInstances(seriesId), contextFor(today));
    for (const QUuid &id : ids) {
        if (m_instanceRepository.removeInstance(id)) {
            ++result.deleted;
        }
    }
    // Whatever is left keeps its content but no longer belongs to a series.
    for (auto instance : m_instanceRepository.fetchInstances(seriesId)) {
        instance.seriesId = QUuid();
        if (m_instanceRepository.updateInstance(instance)) {
            ++result.updated;
        }
    }
    if (!m_seriesRepository.removeSeries(seriesId)) {
        return failure(QStringLiteral("Could not remove series %1").arg(series->name));
    }
    result.success = true;
    result.message = QStringLiteral("Series deleted: %1 removed, %2 kept").arg(result.deleted).arg(result.updated);
    qCInfo(lcCadenceService) << series->name << ":" << result.message;
    return result;
}

SeriesActionResult SeriesService::extendActiveSeries(const QString &today)
{
    SeriesActionResult result;
    result.success = true;
    int extended = 0;
    for (const auto &series : m_seriesRepository.fetchSeries()) {
        if (series.status != data::SeriesStatus::Active) {
            qCDebug(lcCadenceService) << "skipping" << data::seriesStatusToString(series.status) << "series" << series.name;
            continue;
        }
        const auto single = generateMore(series.id, today);
        if (!single.success) {
            result.success = false;
            continue;
        }
        result.created += single.created;
        ++extended;
    }
    result.message = QStringLiteral("Extended %1 active series, %2").arg(extended).arg(plural(result.created, "new instance"));
    return result;
}

} // namespace core
} // namespace cadence
