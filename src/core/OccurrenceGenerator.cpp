#include "cadence/core/OccurrenceGenerator.hpp"

#include "cadence/core/DateMath.hpp"
#include "cadence/core/Logging.hpp"

namespace cadence {
namespace core {

// Accumulates candidates and owns the three stop conditions. Once a candidate
// trips one of them the collector is closed and accepts nothing more.
class OccurrenceGenerator::Collector
{
public:
    explicit Collector(const GenerationBounds &bounds)
        : m_bounds(bounds)
    {
    }

    const QString &startDate() const { return m_bounds.startDate; }
    QStringList takeResult() { return std::move(m_result); }

    // Returns false when generation has to stop.
    bool offer(const QString &candidate)
    {
        if (m_closed) {
            return false;
        }
        if (dates::compare(candidate, m_bounds.startDate) < 0) {
            return true;
        }
        if (m_bounds.endDate && dates::compare(candidate, *m_bounds.endDate) > 0) {
            return close();
        }
        if (m_bounds.maxOccurrences && m_result.size() >= *m_bounds.maxOccurrences) {
            return close();
        }
        if (dates::compare(candidate, m_bounds.generateUntil) > 0) {
            return close();
        }
        if (!m_result.isEmpty() && dates::compare(candidate, m_result.constLast()) <= 0) {
            return true;
        }
        m_result.append(candidate);
        return true;
    }

private:
    bool close()
    {
        m_closed = true;
        return false;
    }

    const GenerationBounds &m_bounds;
    QStringList m_result;
    bool m_closed = false;
};

OccurrenceGenerator::OccurrenceGenerator(RecurrenceRule rule)
    : m_rule(std::move(rule))
{
}

const RecurrenceRule &OccurrenceGenerator::rule() const
{
    return m_rule;
}

QStringList OccurrenceGenerator::generate(const GenerationBounds &bounds) const
{
    if (!dates::isValid(bounds.startDate) || !dates::isValid(bounds.generateUntil)) {
        qCWarning(lcCadenceGenerator) << "invalid generation bounds" << bounds.startDate << bounds.generateUntil;
        return {};
    }
    if (bounds.endDate && !dates::isValid(*bounds.endDate)) {
        qCWarning(lcCadenceGenerator) << "invalid end date" << *bounds.endDate;
        return {};
    }

    GenerationBounds effective = bounds;
    if (effective.maxOccurrences && *effective.maxOccurrences <= 0) {
        // A zero or negative count is the same as no count limit.
        effective.maxOccurrences.reset();
    }

    Collector collector(effective);
    if (!m_rule.isWeeklyClass()) {
        generateMonthly(collector);
    } else if (m_rule.daysOfWeek().isEmpty()) {
        generateWeeklyFromStart(collector);
    } else {
        generateWeeklyOnDays(collector);
    }
    return collector.takeResult();
}

void OccurrenceGenerator::generateWeeklyOnDays(Collector &collector) const
{
    const QString firstWeek = dates::startOfWeek(collector.startDate());
    const int interval = m_rule.weekInterval();

    for (int iteration = 0; iteration < MaxWeeklyIterations; ++iteration) {
        const QString weekStart = dates::addWeeks(firstWeek, iteration * interval);
        for (int weekday : m_rule.daysOfWeek()) {
            if (!collector.offer(dates::addDays(weekStart, weekday))) {
                return;
            }
        }
    }
    qCDebug(lcCadenceGenerator) << "weekly iteration ceiling reached from" << collector.startDate();
}

void OccurrenceGenerator::generateWeeklyFromStart(Collector &collector) const
{
    const int interval = m_rule.weekInterval();
    for (int iteration = 0; iteration < MaxWeeklyIterations; ++iteration) {
        if (!collector.offer(dates::addWeeks(collector.startDate(), iteration * interval))) {
            return;
        }
    }
    qCDebug(lcCadenceGenerator) << "weekly iteration ceiling reached from" << collector.startDate();
}

void OccurrenceGenerator::generateMonthly(Collector &collector) const
{
    const auto &pattern = m_rule.monthlyPattern();
    if (!pattern) {
        return;
    }

    int year = 0;
    int month = 0;
    dates::toParts(collector.startDate(), &year, &month, nullptr);

    for (int iteration = 0; iteration < MaxMonthlyYears * 12; ++iteration) {
        std::optional<QString> candidate;
        if (const auto *byDay = std::get_if<DayOfMonthPattern>(&*pattern)) {
            const int day = qMin(byDay->day, dates::daysInMonth(year, month));
            candidate = dates::fromParts(year, month, day);
        } else {
            const auto &byWeekday = std::get<WeekdayOfMonthPattern>(*pattern);
            candidate = dates::nthWeekdayOfMonth(year, month, byWeekday.weekday, byWeekday.occurrence);
        }

        if (!candidate) {
            qCDebug(lcCadenceGenerator) << "no matching weekday in" << year << month;
        } else if (!collector.offer(*candidate)) {
            return;
        }

        if (++month > 12) {
            month = 1;
            ++year;
        }
    }
    qCDebug(lcCadenceGenerator) << "monthly iteration ceiling reached from" << collector.startDate();
}

QStringList generateOccurrences(const RecurrenceRule &rule,
                                const QString &startDate,
                                const std::optional<QString> &endDate,
                                const std::optional<int> &maxOccurrences,
                                const QString &generateUntil)
{
    GenerationBounds bounds;
    bounds.startDate = startDate;
    bounds.endDate = endDate;
    bounds.maxOccurrences = maxOccurrences;
    bounds.generateUntil = generateUntil;
    return OccurrenceGenerator(rule).generate(bounds);
}

} // namespace core
} // namespace cadence
