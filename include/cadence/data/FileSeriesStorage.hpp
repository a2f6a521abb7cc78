#pragma once

#include <QHash>
#include <QString>
#include <QUuid>

#include "cadence/data/EventInstance.hpp"
#include "cadence/data/SeriesTemplate.hpp"

namespace cadence {
namespace data {

// Series templates and their instances kept together in one
// iCalendar-style file. Every mutation rewrites the file atomically.
class FileSeriesStorage
{
public:
    explicit FileSeriesStorage(QString filePath);
    ~FileSeriesStorage() = default;

    const QString &filePath() const;

    const QHash<QUuid, SeriesTemplate> &series() const;
    const QHash<QUuid, EventInstance> &instances() const;

    SeriesTemplate addOrUpdateSeries(SeriesTemplate series);
    bool removeSeries(const QUuid &id);

    EventInstance addOrUpdateInstance(EventInstance instance);
    bool removeInstance(const QUuid &id);

    bool reload();

private:
    bool load();
    bool save() const;

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDate(const QString &isoDate);
    static QString parseDate(const QString &value);

    QString m_filePath;
    QHash<QUuid, SeriesTemplate> m_series;
    QHash<QUuid, EventInstance> m_instances;
};

} // namespace data
} // namespace cadence
