#pragma once

#include <optional>

#include <QJsonObject>
#include <QString>
#include <QUuid>

#include "cadence/core/RecurrenceRule.hpp"

namespace cadence {
namespace data {

enum class SeriesStatus
{
    Active,
    Paused,
    Ended,
};

struct SeriesTemplate
{
    QUuid id = QUuid::createUuid();
    QString name;
    QString description;
    QString location;
    QString timeStart; // HH:mm
    QString timeEnd;   // HH:mm, may be empty
    std::optional<int> capacity;

    core::RecurrenceRule rule;
    QString startDate;
    std::optional<QString> endDate;
    std::optional<int> maxOccurrences;
    SeriesStatus status = SeriesStatus::Active;

    // Checks the bounds: a valid start date, end date and count not both set,
    // an end date not before the start, a positive count.
    bool isValid(QString *errorString = nullptr) const;

    QJsonObject toJsonObject() const;
    static std::optional<SeriesTemplate> fromJsonObject(const QJsonObject &object, QString *errorString = nullptr);
};

QString seriesStatusToString(SeriesStatus status);
std::optional<SeriesStatus> seriesStatusFromString(const QString &value);

} // namespace data
} // namespace cadence
