#pragma once

#include <optional>
#include <variant>

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QVector>

namespace cadence {
namespace core {

enum class Frequency
{
    Weekly,
    Biweekly,
    Monthly,
};

struct DayOfMonthPattern
{
    int day = 1; // 1..31, clamped to shorter months
};

struct WeekdayOfMonthPattern
{
    static constexpr int Last = -1;

    int weekday = 0;    // 0 = Sunday .. 6 = Saturday
    int occurrence = 1; // 1..5, or Last
};

using MonthlyPattern = std::variant<DayOfMonthPattern, WeekdayOfMonthPattern>;

// Validated, immutable description of how a series repeats. Instances can
// only be obtained through the factories, so downstream code never sees a
// monthly rule without a pattern or an out-of-range weekday.
class RecurrenceRule
{
public:
    // Weekly on the start date's weekday.
    RecurrenceRule();

    static std::optional<RecurrenceRule> weekly(QVector<int> daysOfWeek, QString *errorString = nullptr);
    static std::optional<RecurrenceRule> biweekly(QVector<int> daysOfWeek, QString *errorString = nullptr);
    static std::optional<RecurrenceRule> monthly(const MonthlyPattern &pattern, QString *errorString = nullptr);

    static std::optional<RecurrenceRule> fromJson(const QByteArray &json, QString *errorString = nullptr);
    static std::optional<RecurrenceRule> fromJsonObject(const QJsonObject &object, QString *errorString = nullptr);
    QByteArray toJson() const;
    QJsonObject toJsonObject() const;

    static RecurrenceRule defaultWeeklyRule(const QString &startDate);
    static RecurrenceRule defaultMonthlyRule(const QString &startDate);

    Frequency frequency() const;
    // Ascending and free of duplicates; empty means "the start date's weekday".
    const QVector<int> &daysOfWeek() const;
    const std::optional<MonthlyPattern> &monthlyPattern() const;

    bool isWeeklyClass() const;
    // Weeks between two recurring weeks: 1 for weekly, 2 for biweekly.
    int weekInterval() const;

    bool operator==(const RecurrenceRule &other) const;
    bool operator!=(const RecurrenceRule &other) const;

private:
    RecurrenceRule(Frequency frequency, QVector<int> daysOfWeek, std::optional<MonthlyPattern> pattern);

    static std::optional<RecurrenceRule> weeklyClass(Frequency frequency,
                                                     QVector<int> daysOfWeek,
                                                     QString *errorString);

    Frequency m_frequency = Frequency::Weekly;
    QVector<int> m_daysOfWeek;
    std::optional<MonthlyPattern> m_monthlyPattern;
};

QString frequencyToString(Frequency frequency);
std::optional<Frequency> frequencyFromString(const QString &value);

} // namespace core
} // namespace cadence
