#include "cadence/core/RecurrenceRule.hpp"

#include "cadence/core/DateMath.hpp"
#include "cadence/core/Logging.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <algorithm>

namespace cadence {
namespace core {

namespace {

bool reject(QString *errorString, const QString &message)
{
    qCWarning(lcCadenceRule) << "rejected recurrence rule:" << message;
    if (errorString) {
        *errorString = message;
    }
    return false;
}

bool isWeekday(int value)
{
    return value >= dates::Sunday && value <= dates::Saturday;
}

bool validatePattern(const MonthlyPattern &pattern, QString *errorString)
{
    if (const auto *byDay = std::get_if<DayOfMonthPattern>(&pattern)) {
        if (byDay->day < 1 || byDay->day > 31) {
            return reject(errorString, QStringLiteral("Day of month must be between 1 and 31"));
        }
        return true;
    }
    const auto &byWeekday = std::get<WeekdayOfMonthPattern>(pattern);
    if (!isWeekday(byWeekday.weekday)) {
        return reject(errorString, QStringLiteral("Weekday must be between 0 (Sunday) and 6 (Saturday)"));
    }
    if (byWeekday.occurrence != WeekdayOfMonthPattern::Last
        && (byWeekday.occurrence < 1 || byWeekday.occurrence > 5)) {
        return reject(errorString, QStringLiteral("Occurrence must be 1 to 5, or -1 for the last one"));
    }
    return true;
}

bool readInt(const QJsonObject &object, const QString &key, int *out)
{
    const QJsonValue value = object.value(key);
    if (!value.isDouble()) {
        return false;
    }
    const double raw = value.toDouble();
    if (raw != static_cast<double>(static_cast<int>(raw))) {
        return false;
    }
    *out = static_cast<int>(raw);
    return true;
}

} // namespace

RecurrenceRule::RecurrenceRule() = default;

RecurrenceRule::RecurrenceRule(Frequency frequency, QVector<int> daysOfWeek, std::optional<MonthlyPattern> pattern)
    : m_frequency(frequency)
    , m_daysOfWeek(std::move(daysOfWeek))
    , m_monthlyPattern(std::move(pattern))
{
}

std::optional<RecurrenceRule> RecurrenceRule::weeklyClass(Frequency frequency,
                                                          QVector<int> daysOfWeek,
                                                          QString *errorString)
{
    for (int day : daysOfWeek) {
        if (!isWeekday(day)) {
            reject(errorString, QStringLiteral("Day of week %1 is out of range").arg(day));
            return std::nullopt;
        }
    }
    std::sort(daysOfWeek.begin(), daysOfWeek.end());
    daysOfWeek.erase(std::unique(daysOfWeek.begin(), daysOfWeek.end()), daysOfWeek.end());
    return RecurrenceRule(frequency, std::move(daysOfWeek), std::nullopt);
}

std::optional<RecurrenceRule> RecurrenceRule::weekly(QVector<int> daysOfWeek, QString *errorString)
{
    return weeklyClass(Frequency::Weekly, std::move(daysOfWeek), errorString);
}

std::optional<RecurrenceRule> RecurrenceRule::biweekly(QVector<int> daysOfWeek, QString *errorString)
{
    return weeklyClass(Frequency::Biweekly, std::move(daysOfWeek), errorString);
}

std::optional<RecurrenceRule> RecurrenceRule::monthly(const MonthlyPattern &pattern, QString *errorString)
{
    if (!validatePattern(pattern, errorString)) {
        return std::nullopt;
    }
    return RecurrenceRule(Frequency::Monthly, {}, pattern);
}

std::optional<RecurrenceRule> RecurrenceRule::fromJson(const QByteArray &json, QString *errorString)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        reject(errorString, QStringLiteral("Invalid recurrence pattern: %1").arg(parseError.errorString()));
        return std::nullopt;
    }
    if (!document.isObject()) {
        reject(errorString, QStringLiteral("Invalid recurrence pattern: expected an object"));
        return std::nullopt;
    }
    return fromJsonObject(document.object(), errorString);
}

std::optional<RecurrenceRule> RecurrenceRule::fromJsonObject(const QJsonObject &object, QString *errorString)
{
    const auto frequency = frequencyFromString(object.value(QLatin1String("frequency")).toString());
    if (!frequency) {
        reject(errorString, QStringLiteral("Unknown recurrence frequency"));
        return std::nullopt;
    }

    const QJsonValue daysValue = object.value(QLatin1String("daysOfWeek"));
    const QJsonValue patternValue = object.value(QLatin1String("monthlyPattern"));

    if (*frequency == Frequency::Monthly) {
        if (daysValue.isArray() && !daysValue.toArray().isEmpty()) {
            reject(errorString, QStringLiteral("Monthly rules cannot carry days of the week"));
            return std::nullopt;
        }
        if (!patternValue.isObject()) {
            reject(errorString, QStringLiteral("Monthly rules need a monthly pattern"));
            return std::nullopt;
        }
        const QJsonObject patternObject = patternValue.toObject();
        const QString type = patternObject.value(QLatin1String("type")).toString();
        if (type == QLatin1String("dayOfMonth")) {
            DayOfMonthPattern pattern;
            if (!readInt(patternObject, QStringLiteral("day"), &pattern.day)) {
                reject(errorString, QStringLiteral("Day of month pattern needs a day"));
                return std::nullopt;
            }
            return monthly(pattern, errorString);
        }
        if (type == QLatin1String("weekdayOfMonth")) {
            WeekdayOfMonthPattern pattern;
            if (!readInt(patternObject, QStringLiteral("weekday"), &pattern.weekday)
                || !readInt(patternObject, QStringLiteral("occurrence"), &pattern.occurrence)) {
                reject(errorString, QStringLiteral("Weekday of month pattern needs a weekday and an occurrence"));
                return std::nullopt;
            }
            return monthly(pattern, errorString);
        }
        reject(errorString, QStringLiteral("Unknown monthly pattern type \"%1\"").arg(type));
        return std::nullopt;
    }

    if (!patternValue.isUndefined() && !patternValue.isNull()) {
        reject(errorString, QStringLiteral("Weekly rules cannot carry a monthly pattern"));
        return std::nullopt;
    }

    QVector<int> days;
    if (!daysValue.isUndefined() && !daysValue.isNull()) {
        if (!daysValue.isArray()) {
            reject(errorString, QStringLiteral("daysOfWeek must be an array"));
            return std::nullopt;
        }
        const QJsonArray array = daysValue.toArray();
        days.reserve(array.size());
        for (const QJsonValue &entry : array) {
            if (!entry.isDouble()) {
                reject(errorString, QStringLiteral("daysOfWeek entries must be numbers"));
                return std::nullopt;
            }
            days.append(entry.toInt(-1));
        }
    }
    return weeklyClass(*frequency, std::move(days), errorString);
}

QJsonObject RecurrenceRule::toJsonObject() const
{
    QJsonObject object;
    object.insert(QStringLiteral("frequency"), frequencyToString(m_frequency));
    if (isWeeklyClass()) {
        QJsonArray days;
        for (int day : m_daysOfWeek) {
            days.append(day);
        }
        object.insert(QStringLiteral("daysOfWeek"), days);
        return object;
    }

    QJsonObject pattern;
    if (m_monthlyPattern) {
        if (const auto *byDay = std::get_if<DayOfMonthPattern>(&*m_monthlyPattern)) {
            pattern.insert(QStringLiteral("type"), QStringLiteral("dayOfMonth"));
            pattern.insert(QStringLiteral("day"), byDay->day);
        } else {
            const auto &byWeekday = std::get<WeekdayOfMonthPattern>(*m_monthlyPattern);
            pattern.insert(QStringLiteral("type"), QStringLiteral("weekdayOfMonth"));
            pattern.insert(QStringLiteral("weekday"), byWeekday.weekday);
            pattern.insert(QStringLiteral("occurrence"), byWeekday.occurrence);
        }
    }
    object.insert(QStringLiteral("monthlyPattern"), pattern);
    return object;
}

QByteArray RecurrenceRule::toJson() const
{
    return QJsonDocument(toJsonObject()).toJson(QJsonDocument::Compact);
}

RecurrenceRule RecurrenceRule::defaultWeeklyRule(const QString &startDate)
{
    const int weekday = dates::weekdayOf(startDate);
    if (weekday < 0) {
        return RecurrenceRule();
    }
    return RecurrenceRule(Frequency::Weekly, { weekday }, std::nullopt);
}

RecurrenceRule RecurrenceRule::defaultMonthlyRule(const QString &startDate)
{
    int year = 0;
    int month = 0;
    int day = 0;
    if (!dates::toParts(startDate, &year, &month, &day)) {
        return RecurrenceRule(Frequency::Monthly, {}, MonthlyPattern(DayOfMonthPattern{}));
    }
    WeekdayOfMonthPattern pattern;
    pattern.weekday = dates::weekdayOf(year, month, day);
    pattern.occurrence = (day + 6) / 7;
    if (pattern.occurrence > 4) {
        pattern.occurrence = WeekdayOfMonthPattern::Last;
    }
    return RecurrenceRule(Frequency::Monthly, {}, MonthlyPattern(pattern));
}

Frequency RecurrenceRule::frequency() const
{
    return m_frequency;
}

const QVector<int> &RecurrenceRule::daysOfWeek() const
{
    return m_daysOfWeek;
}

const std::optional<MonthlyPattern> &RecurrenceRule::monthlyPattern() const
{
    return m_monthlyPattern;
}

bool RecurrenceRule::isWeeklyClass() const
{
    return m_frequency == Frequency::Weekly || m_frequency == Frequency::Biweekly;
}

int RecurrenceRule::weekInterval() const
{
    return m_frequency == Frequency::Biweekly ? 2 : 1;
}

bool RecurrenceRule::operator==(const RecurrenceRule &other) const
{
    return toJson() == other.toJson();
}

bool RecurrenceRule::operator!=(const RecurrenceRule &other) const
{
    return !(*this == other);
}

QString frequencyToString(Frequency frequency)
{
    switch (frequency) {
    case Frequency::Biweekly:
        return QStringLiteral("biweekly");
    case Frequency::Monthly:
        return QStringLiteral("monthly");
    case Frequency::Weekly:
    default:
        return QStringLiteral("weekly");
    }
}

std::optional<Frequency> frequencyFromString(const QString &value)
{
    if (value == QLatin1String("weekly")) {
        return Frequency::Weekly;
    }
    if (value == QLatin1String("biweekly")) {
        return Frequency::Biweekly;
    }
    if (value == QLatin1String("monthly")) {
        return Frequency::Monthly;
    }
    return std::nullopt;
}

} // namespace core
} // namespace cadence
