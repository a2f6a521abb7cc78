#include <QtTest/QtTest>

#include "cadence/core/DateMath.hpp"
#include "cadence/core/OccurrenceGenerator.hpp"

using namespace cadence::core;

namespace {

RecurrenceRule weeklyOn(QVector<int> days)
{
    return *RecurrenceRule::weekly(std::move(days));
}

RecurrenceRule biweeklyOn(QVector<int> days)
{
    return *RecurrenceRule::biweekly(std::move(days));
}

RecurrenceRule monthlyOnDay(int day)
{
    DayOfMonthPattern pattern;
    pattern.day = day;
    return *RecurrenceRule::monthly(pattern);
}

RecurrenceRule monthlyOnWeekday(int weekday, int occurrence)
{
    WeekdayOfMonthPattern pattern;
    pattern.weekday = weekday;
    pattern.occurrence = occurrence;
    return *RecurrenceRule::monthly(pattern);
}

GenerationBounds until(const QString &start, const QString &horizon)
{
    GenerationBounds bounds;
    bounds.startDate = start;
    bounds.generateUntil = horizon;
    return bounds;
}

} // namespace

class OccurrenceGeneratorTest : public QObject
{
    Q_OBJECT

private slots:
    void weeklyDaysWithCount();
    void lastFridayOfMonth();
    void fifthWeekdaySkipsMonths();
    void skippedMonthsDoNotCount();
    void biweeklyKeepsWeekParity();
    void endDateIsInclusiveAndExact();
    void horizonIsInclusive();
    void emptyDaySetRepeatsStartWeekday();
    void dayOfMonthClampsToShortMonths();
    void datesBeforeStartAreSkipped();
    void dayOrderDoesNotMatter();
    void iterationCeilings();
    void nonPositiveCountMeansUnlimited();
    void invalidBoundsYieldNothing();
    void sequencesAreAscendingAndBounded();
};

void OccurrenceGeneratorTest::weeklyDaysWithCount()
{
    const auto dates = generateOccurrences(weeklyOn({ 2, 4 }), QStringLiteral("2026-01-06"), std::nullopt, 4,
                                           QStringLiteral("2026-12-31"));
    QCOMPARE(dates, QStringList({ "2026-01-06", "2026-01-08", "2026-01-13", "2026-01-15" }));
}

void OccurrenceGeneratorTest::lastFridayOfMonth()
{
    const auto dates = generateOccurrences(monthlyOnWeekday(5, WeekdayOfMonthPattern::Last),
                                           QStringLiteral("2026-01-01"), std::nullopt, std::nullopt,
                                           QStringLiteral("2026-04-30"));
    QCOMPARE(dates, QStringList({ "2026-01-30", "2026-02-27", "2026-03-27", "2026-04-24" }));
}

void OccurrenceGeneratorTest::fifthWeekdaySkipsMonths()
{
    const auto dates = OccurrenceGenerator(monthlyOnWeekday(5, 5))
                           .generate(until(QStringLiteral("2026-01-01"), QStringLiteral("2026-12-31")));
    QVERIFY(dates.size() < 12);
    QCOMPARE(dates, QStringList({ "2026-01-30", "2026-05-29", "2026-07-31", "2026-10-30" }));
}

void OccurrenceGeneratorTest::skippedMonthsDoNotCount()
{
    auto bounds = until(QStringLiteral("2026-01-01"), QStringLiteral("2030-12-31"));
    bounds.maxOccurrences = 2;
    const auto dates = OccurrenceGenerator(monthlyOnWeekday(5, 5)).generate(bounds);
    QCOMPARE(dates, QStringList({ "2026-01-30", "2026-05-29" }));
}

void OccurrenceGeneratorTest::biweeklyKeepsWeekParity()
{
    const auto dates = OccurrenceGenerator(biweeklyOn({ 1, 3 }))
                           .generate(until(QStringLiteral("2026-01-07"), QStringLiteral("2026-02-08")));
    QCOMPARE(dates, QStringList({ "2026-01-07", "2026-01-19", "2026-01-21", "2026-02-02", "2026-02-04" }));
}

void OccurrenceGeneratorTest::endDateIsInclusiveAndExact()
{
    auto bounds = until(QStringLiteral("2026-01-05"), QStringLiteral("2026-12-31"));
    bounds.endDate = QStringLiteral("2026-01-26");
    const auto dates = OccurrenceGenerator(weeklyOn({ 1 })).generate(bounds);
    QCOMPARE(dates, QStringList({ "2026-01-05", "2026-01-12", "2026-01-19", "2026-01-26" }));

    bounds.endDate = QStringLiteral("2026-01-25");
    QCOMPARE(OccurrenceGenerator(weeklyOn({ 1 })).generate(bounds).size(), 3);
}

void OccurrenceGeneratorTest::horizonIsInclusive()
{
    const auto dates = OccurrenceGenerator(weeklyOn({ 1 }))
                           .generate(until(QStringLiteral("2026-01-05"), QStringLiteral("2026-01-19")));
    QCOMPARE(dates, QStringList({ "2026-01-05", "2026-01-12", "2026-01-19" }));
}

void OccurrenceGeneratorTest::emptyDaySetRepeatsStartWeekday()
{
    const auto dates = OccurrenceGenerator(biweeklyOn({}))
                           .generate(until(QStringLiteral("2026-01-06"), QStringLiteral("2026-02-17")));
    QCOMPARE(dates, QStringList({ "2026-01-06", "2026-01-20", "2026-02-03", "2026-02-17" }));

    const auto defaultRule = OccurrenceGenerator(RecurrenceRule())
                                 .generate(until(QStringLiteral("2026-01-06"), QStringLiteral("2026-01-20")));
    QCOMPARE(defaultRule, QStringList({ "2026-01-06", "2026-01-13", "2026-01-20" }));
}

void OccurrenceGeneratorTest::dayOfMonthClampsToShortMonths()
{
    const auto dates = OccurrenceGenerator(monthlyOnDay(31))
                           .generate(until(QStringLiteral("2026-01-15"), QStringLiteral("2026-05-31")));
    QCOMPARE(dates, QStringList({ "2026-01-31", "2026-02-28", "2026-03-31", "2026-04-30", "2026-05-31" }));
}

void OccurrenceGeneratorTest::datesBeforeStartAreSkipped()
{
    const auto dates = OccurrenceGenerator(monthlyOnDay(10))
                           .generate(until(QStringLiteral("2026-01-15"), QStringLiteral("2026-03-31")));
    QCOMPARE(dates, QStringList({ "2026-02-10", "2026-03-10" }));
}

void OccurrenceGeneratorTest::dayOrderDoesNotMatter()
{
    const auto bounds = until(QStringLiteral("2026-01-01"), QStringLiteral("2026-03-01"));
    QCOMPARE(OccurrenceGenerator(weeklyOn({ 5, 0, 3 })).generate(bounds),
             OccurrenceGenerator(weeklyOn({ 0, 3, 5 })).generate(bounds));
}

void OccurrenceGeneratorTest::iterationCeilings()
{
    const QString farAway = QStringLiteral("2100-01-01");

    const auto sameDay = OccurrenceGenerator(weeklyOn({})).generate(until(QStringLiteral("2026-01-06"), farAway));
    QCOMPARE(sameDay.size(), OccurrenceGenerator::MaxWeeklyIterations);
    QCOMPARE(sameDay.last(), dates::addWeeks(QStringLiteral("2026-01-06"), OccurrenceGenerator::MaxWeeklyIterations - 1));

    const auto twoDays = OccurrenceGenerator(weeklyOn({ 0, 3 })).generate(until(QStringLiteral("2026-01-04"), farAway));
    QCOMPARE(twoDays.size(), OccurrenceGenerator::MaxWeeklyIterations * 2);

    const auto monthly = OccurrenceGenerator(monthlyOnDay(1)).generate(until(QStringLiteral("2026-01-01"), farAway));
    QCOMPARE(monthly.size(), OccurrenceGenerator::MaxMonthlyYears * 12);
    QCOMPARE(monthly.last(), QStringLiteral("2035-12-01"));
}

void OccurrenceGeneratorTest::nonPositiveCountMeansUnlimited()
{
    auto bounds = until(QStringLiteral("2026-01-05"), QStringLiteral("2026-01-19"));
    bounds.maxOccurrences = 0;
    QCOMPARE(OccurrenceGenerator(weeklyOn({ 1 })).generate(bounds).size(), 3);
}

void OccurrenceGeneratorTest::invalidBoundsYieldNothing()
{
    QVERIFY(OccurrenceGenerator(weeklyOn({ 1 })).generate(until(QStringLiteral("2026-02-30"), QStringLiteral("2026-12-31"))).isEmpty());
    QVERIFY(OccurrenceGenerator(weeklyOn({ 1 })).generate(until(QStringLiteral("2026-01-05"), QString())).isEmpty());
    auto bounds = until(QStringLiteral("2026-01-05"), QStringLiteral("2026-12-31"));
    bounds.endDate = QStringLiteral("soon");
    QVERIFY(OccurrenceGenerator(weeklyOn({ 1 })).generate(bounds).isEmpty());
}

void OccurrenceGeneratorTest::sequencesAreAscendingAndBounded()
{
    const QVector<RecurrenceRule> rules = {
        weeklyOn({ 6, 0 }), biweeklyOn({ 2, 4, 6 }), biweeklyOn({}),
        monthlyOnDay(29), monthlyOnWeekday(0, 4), monthlyOnWeekday(3, WeekdayOfMonthPattern::Last),
    };
    auto bounds = until(QStringLiteral("2025-11-19"), QStringLiteral("2027-02-14"));
    bounds.endDate = QStringLiteral("2026-12-20");

    for (const auto &rule : rules) {
        const auto dates = OccurrenceGenerator(rule).generate(bounds);
        QVERIFY(!dates.isEmpty());
        for (int i = 0; i < dates.size(); ++i) {
            QVERIFY(dates::compare(dates.at(i), bounds.startDate) >= 0);
            QVERIFY(dates::compare(dates.at(i), *bounds.endDate) <= 0);
            if (i > 0) {
                QVERIFY(dates::compare(dates.at(i - 1), dates.at(i)) < 0);
            }
        }

        auto counted = bounds;
        counted.endDate.reset();
        counted.maxOccurrences = 5;
        QCOMPARE(OccurrenceGenerator(rule).generate(counted).size(), 5);
    }
}

QTEST_APPLESS_MAIN(OccurrenceGeneratorTest)
#include "OccurrenceGeneratorTest.moc"
