#pragma once

#include <optional>

#include <QString>

namespace cadence {
namespace core {

// Calendar arithmetic on plain calendar dates. Every value is either an
// explicit (year, month, day) triple or its canonical "yyyy-MM-dd" string;
// nothing here ever looks at a clock or a timezone.
namespace dates {

constexpr auto ISO_DATE_FORMAT = "yyyy-MM-dd";

constexpr int Sunday = 0;
constexpr int Saturday = 6;

bool isLeapYear(int year);
int daysInMonth(int year, int month);

// 0 = Sunday .. 6 = Saturday, -1 for an invalid date.
int weekdayOf(int year, int month, int day);
int weekdayOf(const QString &date);

bool isValid(const QString &date);
QString fromParts(int year, int month, int day);
bool toParts(const QString &date, int *year, int *month, int *day);

// Invalid input yields an empty string.
QString addDays(const QString &date, int days);
QString addWeeks(const QString &date, int weeks);
// Clamps to the last day of the target month (2025-01-31 + 1 -> 2025-02-28).
QString addMonths(const QString &date, int months);

// -1, 0 or 1.
int compare(const QString &lhs, const QString &rhs);
QString earliest(const QString &lhs, const QString &rhs);
QString latest(const QString &lhs, const QString &rhs);

// Signed number of days from `from` to `to`.
qint64 daysBetween(const QString &from, const QString &to);

// Sunday that opens the week containing `date`.
QString startOfWeek(const QString &date);

// occurrence is 1..5 or -1 for the last such weekday of the month.
std::optional<QString> nthWeekdayOfMonth(int year, int month, int weekday, int occurrence);

} // namespace dates
} // namespace core
} // namespace cadence
