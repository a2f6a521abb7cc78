#pragma once

#include <optional>

#include <QString>
#include <QUuid>

namespace cadence {
namespace data {

struct EventInstance
{
    QUuid id = QUuid::createUuid();
    QUuid seriesId; // null once detached from its series
    QString slug;
    QString instanceDate;
    bool isException = false;
    int registrationCount = 0;

    QString name;
    QString description;
    QString location;
    QString timeStart;
    QString timeEnd;
    std::optional<int> capacity;

    bool hasRegistrations() const { return registrationCount > 0; }
};

} // namespace data
} // namespace cadence
