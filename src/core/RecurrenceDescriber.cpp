#include "cadence/core/RecurrenceDescriber.hpp"

#include <QStringList>
#include <array>

namespace cadence {
namespace core {

namespace {
const std::array<const char *, 7> DAY_NAMES = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday",
};

const std::array<const char *, 7> DAY_SHORT_NAMES = {
    "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat",
};
} // namespace

QString frequencyLabel(Frequency frequency)
{
    switch (frequency) {
    case Frequency::Biweekly:
        return QStringLiteral("Every 2 weeks");
    case Frequency::Monthly:
        return QStringLiteral("Monthly");
    case Frequency::Weekly:
    default:
        return QStringLiteral("Weekly");
    }
}

QString weekdayName(int weekday)
{
    if (weekday < 0 || weekday >= static_cast<int>(DAY_NAMES.size())) {
        return {};
    }
    return QString::fromLatin1(DAY_NAMES[static_cast<size_t>(weekday)]);
}

QString weekdayShortName(int weekday)
{
    if (weekday < 0 || weekday >= static_cast<int>(DAY_SHORT_NAMES.size())) {
        return {};
    }
    return QString::fromLatin1(DAY_SHORT_NAMES[static_cast<size_t>(weekday)]);
}

QString ordinalSuffix(int number)
{
    const int lastTwo = number % 100;
    if (lastTwo >= 11 && lastTwo <= 13) {
        return QStringLiteral("th");
    }
    switch (number % 10) {
    case 1:
        return QStringLiteral("st");
    case 2:
        return QStringLiteral("nd");
    case 3:
        return QStringLiteral("rd");
    default:
        return QStringLiteral("th");
    }
}

QString occurrenceLabel(int occurrence)
{
    if (occurrence == WeekdayOfMonthPattern::Last) {
        return QStringLiteral("Last");
    }
    return QString::number(occurrence) + ordinalSuffix(occurrence);
}

QString describeRecurrenceRule(const RecurrenceRule &rule)
{
    if (rule.isWeeklyClass()) {
        const QString prefix = rule.frequency() == Frequency::Weekly ? QStringLiteral("Every")
                                                                     : QStringLiteral("Every other");
        if (rule.daysOfWeek().isEmpty()) {
            return prefix + QStringLiteral(" week");
        }
        QStringList names;
        for (int day : rule.daysOfWeek()) {
            names << weekdayName(day);
        }
        return QStringLiteral("%1 %2").arg(prefix, names.join(QStringLiteral(", ")));
    }

    const auto &pattern = rule.monthlyPattern();
    if (!pattern) {
        return frequencyLabel(rule.frequency());
    }
    if (const auto *byDay = std::get_if<DayOfMonthPattern>(&*pattern)) {
        return QStringLiteral("Monthly on the %1%2").arg(byDay->day).arg(ordinalSuffix(byDay->day));
    }
    const auto &byWeekday = std::get<WeekdayOfMonthPattern>(*pattern);
    return QStringLiteral("Monthly on the %1 %2")
        .arg(occurrenceLabel(byWeekday.occurrence), weekdayName(byWeekday.weekday));
}

} // namespace core
} // namespace cadence
