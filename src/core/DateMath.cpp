#include "cadence/core/DateMath.hpp"

#include "cadence/core/Logging.hpp"

#include <QDate>

namespace cadence {
namespace core {
namespace dates {

namespace {

// QDate counts Julian days and carries no time or zone, which makes it the
// calculation device for everything in this file. It never leaves it.
QDate parse(const QString &date)
{
    if (date.size() != 10) {
        return {};
    }
    return QDate::fromString(date, QLatin1String(ISO_DATE_FORMAT));
}

QString format(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return date.toString(QLatin1String(ISO_DATE_FORMAT));
}

int toSundayBased(const QDate &date)
{
    // QDate uses 1 = Monday .. 7 = Sunday.
    return date.dayOfWeek() % 7;
}

} // namespace

bool isLeapYear(int year)
{
    return QDate::isLeapYear(year);
}

int daysInMonth(int year, int month)
{
    if (month < 1 || month > 12) {
        return 0;
    }
    return QDate(year, month, 1).daysInMonth();
}

int weekdayOf(int year, int month, int day)
{
    const QDate date(year, month, day);
    if (!date.isValid()) {
        return -1;
    }
    return toSundayBased(date);
}

int weekdayOf(const QString &date)
{
    const QDate parsed = parse(date);
    if (!parsed.isValid()) {
        return -1;
    }
    return toSundayBased(parsed);
}

bool isValid(const QString &date)
{
    return parse(date).isValid();
}

QString fromParts(int year, int month, int day)
{
    return format(QDate(year, month, day));
}

bool toParts(const QString &date, int *year, int *month, int *day)
{
    const QDate parsed = parse(date);
    if (!parsed.isValid()) {
        return false;
    }
    if (year) {
        *year = parsed.year();
    }
    if (month) {
        *month = parsed.month();
    }
    if (day) {
        *day = parsed.day();
    }
    return true;
}

QString addDays(const QString &date, int days)
{
    const QDate parsed = parse(date);
    if (!parsed.isValid()) {
        qCWarning(lcCadenceDates) << "addDays on invalid date" << date;
        return {};
    }
    return format(parsed.addDays(days));
}

QString addWeeks(const QString &date, int weeks)
{
    return addDays(date, weeks * 7);
}

QString addMonths(const QString &date, int months)
{
    const QDate parsed = parse(date);
    if (!parsed.isValid()) {
        qCWarning(lcCadenceDates) << "addMonths on invalid date" << date;
        return {};
    }
    int year = parsed.year();
    int month = parsed.month() + months;
    year += (month - 1) / 12;
    month = (month - 1) % 12 + 1;
    if (month < 1) {
        month += 12;
        --year;
    }
    const int day = qMin(parsed.day(), daysInMonth(year, month));
    return fromParts(year, month, day);
}

int compare(const QString &lhs, const QString &rhs)
{
    // Zero padded yyyy-MM-dd sorts lexically in calendar order.
    const int result = QString::compare(lhs, rhs, Qt::CaseSensitive);
    if (result < 0) {
        return -1;
    }
    return result > 0 ? 1 : 0;
}

QString earliest(const QString &lhs, const QString &rhs)
{
    return compare(lhs, rhs) <= 0 ? lhs : rhs;
}

QString latest(const QString &lhs, const QString &rhs)
{
    return compare(lhs, rhs) >= 0 ? lhs : rhs;
}

qint64 daysBetween(const QString &from, const QString &to)
{
    const QDate start = parse(from);
    const QDate end = parse(to);
    if (!start.isValid() || !end.isValid()) {
        return 0;
    }
    return start.daysTo(end);
}

QString startOfWeek(const QString &date)
{
    const QDate parsed = parse(date);
    if (!parsed.isValid()) {
        return {};
    }
    return format(parsed.addDays(-toSundayBased(parsed)));
}

std::optional<QString> nthWeekdayOfMonth(int year, int month, int weekday, int occurrence)
{
    if (weekday < Sunday || weekday > Saturday || month < 1 || month > 12) {
        return std::nullopt;
    }
    const int lastDay = daysInMonth(year, month);

    if (occurrence == -1) {
        const int lastWeekday = weekdayOf(year, month, lastDay);
        const int back = (lastWeekday - weekday + 7) % 7;
        return fromParts(year, month, lastDay - back);
    }
    if (occurrence < 1) {
        return std::nullopt;
    }

    const int firstWeekday = weekdayOf(year, month, 1);
    const int day = 1 + (weekday - firstWeekday + 7) % 7 + (occurrence - 1) * 7;
    if (day > lastDay) {
        return std::nullopt;
    }
    return fromParts(year, month, day);
}

} // namespace dates
} // namespace core
} // namespace cadence
