#include "cadence/data/SeriesTemplate.hpp"

#include "cadence/core/DateMath.hpp"
#include "cadence/core/Logging.hpp"

#include <QJsonValue>

namespace cadence {
namespace data {

namespace {

bool fail(QString *errorString, const QString &message)
{
    if (errorString) {
        *errorString = message;
    }
    return false;
}

QJsonValue optionalInt(const std::optional<int> &value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

std::optional<int> readOptionalInt(const QJsonObject &object, const QString &key)
{
    const QJsonValue value = object.value(key);
    if (!value.isDouble()) {
        return std::nullopt;
    }
    return value.toInt();
}

std::optional<QString> readOptionalString(const QJsonObject &object, const QString &key)
{
    const QString value = object.value(key).toString();
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

bool SeriesTemplate::isValid(QString *errorString) const
{
    if (name.trimmed().isEmpty()) {
        return fail(errorString, QStringLiteral("Name is required"));
    }
    if (!core::dates::isValid(startDate)) {
        return fail(errorString, QStringLiteral("Start date must be a YYYY-MM-DD date"));
    }
    if (endDate && maxOccurrences) {
        return fail(errorString, QStringLiteral("End date and maximum occurrences are mutually exclusive"));
    }
    if (endDate) {
        if (!core::dates::isValid(*endDate)) {
            return fail(errorString, QStringLiteral("End date must be a YYYY-MM-DD date"));
        }
        if (core::dates::compare(*endDate, startDate) < 0) {
            return fail(errorString, QStringLiteral("End date is before the start date"));
        }
    }
    if (maxOccurrences && *maxOccurrences <= 0) {
        return fail(errorString, QStringLiteral("Maximum occurrences must be positive"));
    }
    if (capacity && *capacity < 0) {
        return fail(errorString, QStringLiteral("Capacity cannot be negative"));
    }
    return true;
}

QJsonObject SeriesTemplate::toJsonObject() const
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), id.toString(QUuid::WithoutBraces));
    object.insert(QStringLiteral("name"), name);
    object.insert(QStringLiteral("description"), description);
    object.insert(QStringLiteral("location"), location);
    object.insert(QStringLiteral("timeStart"), timeStart);
    if (!timeEnd.isEmpty()) {
        object.insert(QStringLiteral("timeEnd"), timeEnd);
    }
    object.insert(QStringLiteral("capacity"), optionalInt(capacity));
    object.insert(QStringLiteral("recurrenceRule"), rule.toJsonObject());
    object.insert(QStringLiteral("startDate"), startDate);
    object.insert(QStringLiteral("endDate"), endDate ? QJsonValue(*endDate) : QJsonValue(QJsonValue::Null));
    object.insert(QStringLiteral("maxOccurrences"), optionalInt(maxOccurrences));
    object.insert(QStringLiteral("status"), seriesStatusToString(status));
    return object;
}

std::optional<SeriesTemplate> SeriesTemplate::fromJsonObject(const QJsonObject &object, QString *errorString)
{
    SeriesTemplate series;
    const QString idValue = object.value(QLatin1String("id")).toString();
    if (!idValue.isEmpty()) {
        series.id = QUuid(QStringLiteral("{%1}").arg(idValue));
        if (series.id.isNull()) {
            fail(errorString, QStringLiteral("Invalid series id \"%1\"").arg(idValue));
            return std::nullopt;
        }
    }
    series.name = object.value(QLatin1String("name")).toString().trimmed();
    series.description = object.value(QLatin1String("description")).toString().trimmed();
    series.location = object.value(QLatin1String("location")).toString().trimmed();
    series.timeStart = object.value(QLatin1String("timeStart")).toString();
    series.timeEnd = object.value(QLatin1String("timeEnd")).toString().trimmed();
    series.capacity = readOptionalInt(object, QStringLiteral("capacity"));
    series.startDate = object.value(QLatin1String("startDate")).toString();
    series.endDate = readOptionalString(object, QStringLiteral("endDate"));
    series.maxOccurrences = readOptionalInt(object, QStringLiteral("maxOccurrences"));

    const QJsonValue statusValue = object.value(QLatin1String("status"));
    if (!statusValue.isUndefined()) {
        const auto status = seriesStatusFromString(statusValue.toString());
        if (!status) {
            fail(errorString, QStringLiteral("Unknown series status \"%1\"").arg(statusValue.toString()));
            return std::nullopt;
        }
        series.status = *status;
    }

    const QJsonValue ruleValue = object.value(QLatin1String("recurrenceRule"));
    if (!ruleValue.isObject()) {
        fail(errorString, QStringLiteral("Recurrence pattern is required"));
        return std::nullopt;
    }
    auto rule = core::RecurrenceRule::fromJsonObject(ruleValue.toObject(), errorString);
    if (!rule) {
        return std::nullopt;
    }
    series.rule = std::move(*rule);

    if (!series.isValid(errorString)) {
        qCWarning(lcCadenceService) << "rejected series" << series.name;
        return std::nullopt;
    }
    return series;
}

QString seriesStatusToString(SeriesStatus status)
{
    switch (status) {
    case SeriesStatus::Paused:
        return QStringLiteral("paused");
    case SeriesStatus::Ended:
        return QStringLiteral("ended");
    case SeriesStatus::Active:
    default:
        return QStringLiteral("active");
    }
}

std::optional<SeriesStatus> seriesStatusFromString(const QString &value)
{
    const QString normalized = value.toLower();
    if (normalized == QLatin1String("active")) {
        return SeriesStatus::Active;
    }
    if (normalized == QLatin1String("paused")) {
        return SeriesStatus::Paused;
    }
    if (normalized == QLatin1String("ended")) {
        return SeriesStatus::Ended;
    }
    return std::nullopt;
}

} // namespace data
} // namespace cadence
