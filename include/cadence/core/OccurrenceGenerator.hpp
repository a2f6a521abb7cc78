#pragma once

#include <optional>

#include <QString>
#include <QStringList>

#include "cadence/core/RecurrenceRule.hpp"

namespace cadence {
namespace core {

struct GenerationBounds
{
    QString startDate;                  // inclusive
    std::optional<QString> endDate;     // inclusive
    std::optional<int> maxOccurrences;  // counted from startDate
    QString generateUntil;              // inclusive horizon
};

class OccurrenceGenerator
{
public:
    // Hard ceilings that hold whatever the bounds say.
    static constexpr int MaxWeeklyIterations = 520;
    static constexpr int MaxMonthlyYears = 10;

    explicit OccurrenceGenerator(RecurrenceRule rule);

    // Ascending, duplicate free dates within the bounds. Invalid bounds give
    // an empty list.
    QStringList generate(const GenerationBounds &bounds) const;

    const RecurrenceRule &rule() const;

private:
    class Collector;

    void generateWeeklyOnDays(Collector &collector) const;
    void generateWeeklyFromStart(Collector &collector) const;
    void generateMonthly(Collector &collector) const;

    RecurrenceRule m_rule;
};

QStringList generateOccurrences(const RecurrenceRule &rule,
                                const QString &startDate,
                                const std::optional<QString> &endDate,
                                const std::optional<int> &maxOccurrences,
                                const QString &generateUntil);

} // namespace core
} // namespace cadence
