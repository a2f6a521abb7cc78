#include "cadence/data/FileSeriesStorage.hpp"

#include "cadence/core/DateMath.hpp"
#include "cadence/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>
#include <algorithm>

namespace cadence {
namespace data {

namespace {
constexpr auto SERIES_BEGIN = "BEGIN:X-CADENCE-SERIES";
constexpr auto SERIES_END = "END:X-CADENCE-SERIES";

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    QUuid id(QStringLiteral("{%1}").arg(value));
    if (id.isNull()) {
        return QUuid::createUuid();
    }
    return id;
}

std::optional<int> parseOptionalInt(const QString &value)
{
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return parsed;
}

bool parseFlag(const QString &value)
{
    return value.compare(QLatin1String("TRUE"), Qt::CaseInsensitive) == 0;
}
} // namespace

FileSeriesStorage::FileSeriesStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QString &FileSeriesStorage::filePath() const
{
    return m_filePath;
}

const QHash<QUuid, SeriesTemplate> &FileSeriesStorage::series() const
{
    return m_series;
}

const QHash<QUuid, EventInstance> &FileSeriesStorage::instances() const
{
    return m_instances;
}

SeriesTemplate FileSeriesStorage::addOrUpdateSeries(SeriesTemplate series)
{
    if (series.id.isNull()) {
        series.id = QUuid::createUuid();
    }
    m_series.insert(series.id, series);
    save();
    return series;
}

bool FileSeriesStorage::removeSeries(const QUuid &id)
{
    if (m_series.remove(id) > 0) {
        return save();
    }
    return false;
}

EventInstance FileSeriesStorage::addOrUpdateInstance(EventInstance instance)
{
    if (instance.id.isNull()) {
        instance.id = QUuid::createUuid();
    }
    m_instances.insert(instance.id, instance);
    save();
    return instance;
}

bool FileSeriesStorage::removeInstance(const QUuid &id)
{
    if (m_instances.remove(id) > 0) {
        return save();
    }
    return false;
}

bool FileSeriesStorage::reload()
{
    return load();
}

bool FileSeriesStorage::load()
{
    m_series.clear();
    m_instances.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcCadenceStorage) << "cannot open" << m_filePath << ":" << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    enum class Section {
        None,
        Series,
        Instance
    };

    Section currentSection = Section::None;
    SeriesTemplate currentSeries;
    QString currentRule;
    EventInstance currentInstance;
    int skipped = 0;

    auto finalizeSeries = [&]() {
        QString error;
        auto rule = core::RecurrenceRule::fromJson(currentRule.toUtf8(), &error);
        if (!rule) {
            qCWarning(lcCadenceStorage) << "dropping series" << currentSeries.id << "with bad rule:" << error;
            ++skipped;
            return;
        }
        currentSeries.rule = std::move(*rule);
        if (!currentSeries.isValid(&error)) {
            qCWarning(lcCadenceStorage) << "dropping series" << currentSeries.id << ":" << error;
            ++skipped;
            return;
        }
        m_series.insert(currentSeries.id, currentSeries);
    };

    auto finalizeInstance = [&]() {
        if (!core::dates::isValid(currentInstance.instanceDate)) {
            qCWarning(lcCadenceStorage) << "dropping instance" << currentInstance.id << "without a date";
            ++skipped;
            return;
        }
        m_instances.insert(currentInstance.id, currentInstance);
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String(SERIES_BEGIN)) {
            currentSection = Section::Series;
            currentSeries = SeriesTemplate{};
            currentRule.clear();
            return;
        }
        if (line == QLatin1String(SERIES_END)) {
            finalizeSeries();
            currentSection = Section::None;
            return;
        }
        if (line == QLatin1String("BEGIN:VEVENT")) {
            currentSection = Section::Instance;
            currentInstance = EventInstance{};
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            finalizeInstance();
            currentSection = Section::None;
            return;
        }

        if (currentSection == Section::None) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString value = decodeText(rawValue);

        if (currentSection == Section::Series) {
            if (name == QLatin1String("UID")) {
                currentSeries.id = parseUid(value);
            } else if (name == QLatin1String("SUMMARY")) {
                currentSeries.name = value;
            } else if (name == QLatin1String("DESCRIPTION")) {
                currentSeries.description = value;
            } else if (name == QLatin1String("LOCATION")) {
                currentSeries.location = value;
            } else if (name == QLatin1String("DTSTART")) {
                currentSeries.startDate = parseDate(rawValue);
            } else if (name == QLatin1String("X-CADENCE-END-DATE")) {
                currentSeries.endDate = parseDate(rawValue);
            } else if (name == QLatin1String("X-CADENCE-COUNT")) {
                currentSeries.maxOccurrences = parseOptionalInt(rawValue);
            } else if (name == QLatin1String("X-CADENCE-RULE")) {
                currentRule = value;
            } else if (name == QLatin1String("X-CADENCE-TIME-START")) {
                currentSeries.timeStart = value;
            } else if (name == QLatin1String("X-CADENCE-TIME-END")) {
                currentSeries.timeEnd = value;
            } else if (name == QLatin1String("X-CADENCE-CAPACITY")) {
                currentSeries.capacity = parseOptionalInt(rawValue);
            } else if (name == QLatin1String("STATUS")) {
                currentSeries.status = seriesStatusFromString(rawValue).value_or(SeriesStatus::Active);
            }
            return;
        }

        if (name == QLatin1String("UID")) {
            currentInstance.id = parseUid(value);
        } else if (name == QLatin1String("X-CADENCE-SERIES-ID")) {
            currentInstance.seriesId = parseUid(value);
        } else if (name == QLatin1String("X-CADENCE-SLUG")) {
            currentInstance.slug = value;
        } else if (name == QLatin1String("DTSTART")) {
            currentInstance.instanceDate = parseDate(rawValue);
        } else if (name == QLatin1String("X-CADENCE-EXCEPTION")) {
            currentInstance.isException = parseFlag(rawValue);
        } else if (name == QLatin1String("X-CADENCE-REGISTRATIONS")) {
            currentInstance.registrationCount = parseOptionalInt(rawValue).value_or(0);
        } else if (name == QLatin1String("SUMMARY")) {
            currentInstance.name = value;
        } else if (name == QLatin1String("DESCRIPTION")) {
            currentInstance.description = value;
        } else if (name == QLatin1String("LOCATION")) {
            currentInstance.location = value;
        } else if (name == QLatin1String("X-CADENCE-TIME-START")) {
            currentInstance.timeStart = value;
        } else if (name == QLatin1String("X-CADENCE-TIME-END")) {
            currentInstance.timeEnd = value;
        } else if (name == QLatin1String("X-CADENCE-CAPACITY")) {
            currentInstance.capacity = parseOptionalInt(rawValue);
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    qCDebug(lcCadenceStorage) << "loaded" << m_series.size() << "series and" << m_instances.size()
                              << "instances from" << m_filePath;
    return skipped == 0;
}

bool FileSeriesStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return true;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcCadenceStorage) << "cannot write" << m_filePath << ":" << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Cadence//EN\n";

    auto series = m_series.values();
    std::sort(series.begin(), series.end(), [](const SeriesTemplate &lhs, const SeriesTemplate &rhs) {
        return lhs.startDate < rhs.startDate;
    });
    for (const SeriesTemplate &item : series) {
        stream << SERIES_BEGIN << '\n';
        stream << "UID:" << prepareUid(item.id) << '\n';
        stream << "SUMMARY:" << encodeText(item.name) << '\n';
        if (!item.description.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(item.description) << '\n';
        }
        if (!item.location.isEmpty()) {
            stream << "LOCATION:" << encodeText(item.location) << '\n';
        }
        stream << "DTSTART;VALUE=DATE:" << formatDate(item.startDate) << '\n';
        if (item.endDate) {
            stream << "X-CADENCE-END-DATE;VALUE=DATE:" << formatDate(*item.endDate) << '\n';
        }
        if (item.maxOccurrences) {
            stream << "X-CADENCE-COUNT:" << *item.maxOccurrences << '\n';
        }
        stream << "X-CADENCE-RULE:" << encodeText(QString::fromUtf8(item.rule.toJson())) << '\n';
        if (!item.timeStart.isEmpty()) {
            stream << "X-CADENCE-TIME-START:" << encodeText(item.timeStart) << '\n';
        }
        if (!item.timeEnd.isEmpty()) {
            stream << "X-CADENCE-TIME-END:" << encodeText(item.timeEnd) << '\n';
        }
        if (item.capacity) {
            stream << "X-CADENCE-CAPACITY:" << *item.capacity << '\n';
        }
        stream << "STATUS:" << seriesStatusToString(item.status).toUpper() << '\n';
        stream << SERIES_END << '\n';
    }

    auto instances = m_instances.values();
    std::sort(instances.begin(), instances.end(), [](const EventInstance &lhs, const EventInstance &rhs) {
        if (lhs.instanceDate == rhs.instanceDate) {
            return lhs.slug < rhs.slug;
        }
        return lhs.instanceDate < rhs.instanceDate;
    });
    for (const EventInstance &instance : instances) {
        stream << "BEGIN:VEVENT\n";
        stream << "UID:" << prepareUid(instance.id) << '\n';
        if (!instance.seriesId.isNull()) {
            stream << "X-CADENCE-SERIES-ID:" << prepareUid(instance.seriesId) << '\n';
        }
        stream << "X-CADENCE-SLUG:" << encodeText(instance.slug) << '\n';
        stream << "DTSTART;VALUE=DATE:" << formatDate(instance.instanceDate) << '\n';
        stream << "SUMMARY:" << encodeText(instance.name) << '\n';
        if (!instance.description.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(instance.description) << '\n';
        }
        if (!instance.location.isEmpty()) {
            stream << "LOCATION:" << encodeText(instance.location) << '\n';
        }
        if (!instance.timeStart.isEmpty()) {
            stream << "X-CADENCE-TIME-START:" << encodeText(instance.timeStart) << '\n';
        }
        if (!instance.timeEnd.isEmpty()) {
            stream << "X-CADENCE-TIME-END:" << encodeText(instance.timeEnd) << '\n';
        }
        if (instance.capacity) {
            stream << "X-CADENCE-CAPACITY:" << *instance.capacity << '\n';
        }
        if (instance.isException) {
            stream << "X-CADENCE-EXCEPTION:TRUE\n";
        }
        if (instance.registrationCount > 0) {
            stream << "X-CADENCE-REGISTRATIONS:" << instance.registrationCount << '\n';
        }
        stream << "END:VEVENT\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (!file.commit()) {
        qCWarning(lcCadenceStorage) << "cannot commit" << m_filePath << ":" << file.errorString();
        return false;
    }
    return true;
}

QString FileSeriesStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FileSeriesStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c != '\\' || i + 1 == text.size()) {
            decoded.append(c);
            continue;
        }
        const QChar next = text.at(++i);
        if (next == 'n' || next == 'N') {
            decoded.append('\n');
        } else {
            decoded.append(next);
        }
    }
    return decoded;
}

QString FileSeriesStorage::formatDate(const QString &isoDate)
{
    QString compact = isoDate;
    return compact.remove('-');
}

QString FileSeriesStorage::parseDate(const QString &value)
{
    if (value.size() != 8) {
        return {};
    }
    bool yearOk = false;
    bool monthOk = false;
    bool dayOk = false;
    const int year = value.leftRef(4).toInt(&yearOk);
    const int month = value.midRef(4, 2).toInt(&monthOk);
    const int day = value.midRef(6, 2).toInt(&dayOk);
    if (!yearOk || !monthOk || !dayOk) {
        return {};
    }
    return core::dates::fromParts(year, month, day);
}

} // namespace data
} // namespace cadence
