#include <QtTest/QtTest>

#include "cadence/core/RecurrenceRule.hpp"

using namespace cadence::core;

class RecurrenceRuleTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesWeeklyRule();
    void parsesMonthlyPatterns();
    void rejectsMalformedRules_data();
    void rejectsMalformedRules();
    void normalizesDaysOfWeek();
    void serializesInStoredShape();
    void defaultRulesFollowStartDate();
};

void RecurrenceRuleTest::parsesWeeklyRule()
{
    const auto rule = RecurrenceRule::fromJson(R"({"frequency":"biweekly","daysOfWeek":[4,2]})");
    QVERIFY(rule.has_value());
    QCOMPARE(rule->frequency(), Frequency::Biweekly);
    QCOMPARE(rule->daysOfWeek(), (QVector<int>{ 2, 4 }));
    QCOMPARE(rule->weekInterval(), 2);
    QVERIFY(rule->isWeeklyClass());
    QVERIFY(!rule->monthlyPattern().has_value());

    const auto sameDay = RecurrenceRule::fromJson(R"({"frequency":"weekly"})");
    QVERIFY(sameDay.has_value());
    QVERIFY(sameDay->daysOfWeek().isEmpty());
}

void RecurrenceRuleTest::parsesMonthlyPatterns()
{
    const auto byDay = RecurrenceRule::fromJson(R"({"frequency":"monthly","monthlyPattern":{"type":"dayOfMonth","day":31}})");
    QVERIFY(byDay.has_value());
    QVERIFY(!byDay->isWeeklyClass());
    QVERIFY(byDay->monthlyPattern().has_value());
    QCOMPARE(std::get<DayOfMonthPattern>(*byDay->monthlyPattern()).day, 31);

    const auto lastFriday = RecurrenceRule::fromJson(
        R"({"frequency":"monthly","monthlyPattern":{"type":"weekdayOfMonth","weekday":5,"occurrence":-1}})");
    QVERIFY(lastFriday.has_value());
    const auto pattern = std::get<WeekdayOfMonthPattern>(*lastFriday->monthlyPattern());
    QCOMPARE(pattern.weekday, 5);
    QCOMPARE(pattern.occurrence, WeekdayOfMonthPattern::Last);
}

void RecurrenceRuleTest::rejectsMalformedRules_data()
{
    QTest::addColumn<QByteArray>("json");

    QTest::newRow("not json") << QByteArray("{frequency");
    QTest::newRow("array") << QByteArray("[1,2]");
    QTest::newRow("unknown frequency") << QByteArray(R"({"frequency":"daily"})");
    QTest::newRow("monthly without pattern") << QByteArray(R"({"frequency":"monthly"})");
    QTest::newRow("monthly with days") << QByteArray(
        R"({"frequency":"monthly","daysOfWeek":[1],"monthlyPattern":{"type":"dayOfMonth","day":1}})");
    QTest::newRow("weekly with pattern") << QByteArray(
        R"({"frequency":"weekly","monthlyPattern":{"type":"dayOfMonth","day":1}})");
    QTest::newRow("weekday out of range") << QByteArray(R"({"frequency":"weekly","daysOfWeek":[7]})");
    QTest::newRow("negative weekday") << QByteArray(R"({"frequency":"weekly","daysOfWeek":[-1]})");
    QTest::newRow("day of month zero") << QByteArray(
        R"({"frequency":"monthly","monthlyPattern":{"type":"dayOfMonth","day":0}})");
    QTest::newRow("day of month 32") << QByteArray(
        R"({"frequency":"monthly","monthlyPattern":{"type":"dayOfMonth","day":32}})");
    QTest::newRow("occurrence zero") << QByteArray(
        R"({"frequency":"monthly","monthlyPattern":{"type":"weekdayOfMonth","weekday":1,"occurrence":0}})");
    QTest::newRow("occurrence -2") << QByteArray(
        R"({"frequency":"monthly","monthlyPattern":{"type":"weekdayOfMonth","weekday":1,"occurrence":-2}})");
    QTest::newRow("missing weekday") << QByteArray(
        R"({"frequency":"monthly","monthlyPattern":{"type":"weekdayOfMonth","occurrence":1}})");
    QTest::newRow("unknown pattern") << QByteArray(
        R"({"frequency":"monthly","monthlyPattern":{"type":"lastDay"}})");
}

void RecurrenceRuleTest::rejectsMalformedRules()
{
    QFETCH(QByteArray, json);
    QString error;
    QVERIFY(!RecurrenceRule::fromJson(json, &error).has_value());
    QVERIFY(!error.isEmpty());
}

void RecurrenceRuleTest::normalizesDaysOfWeek()
{
    const auto rule = RecurrenceRule::weekly({ 5, 1, 3, 1 });
    QVERIFY(rule.has_value());
    QCOMPARE(rule->daysOfWeek(), (QVector<int>{ 1, 3, 5 }));

    QString error;
    QVERIFY(!RecurrenceRule::biweekly({ 1, 9 }, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("9")));
}

void RecurrenceRuleTest::serializesInStoredShape()
{
    const auto weekly = RecurrenceRule::weekly({ 4, 2 });
    QVERIFY(weekly.has_value());
    QCOMPARE(weekly->toJson(), QByteArray(R"({"daysOfWeek":[2,4],"frequency":"weekly"})"));

    WeekdayOfMonthPattern secondTuesday;
    secondTuesday.weekday = 2;
    secondTuesday.occurrence = 2;
    const auto monthly = RecurrenceRule::monthly(secondTuesday);
    QVERIFY(monthly.has_value());
    const auto reparsed = RecurrenceRule::fromJson(monthly->toJson());
    QVERIFY(reparsed.has_value());
    QVERIFY(*reparsed == *monthly);
    QVERIFY(*reparsed != *weekly);
}

void RecurrenceRuleTest::defaultRulesFollowStartDate()
{
    const auto weekly = RecurrenceRule::defaultWeeklyRule(QStringLiteral("2026-01-06"));
    QCOMPARE(weekly.frequency(), Frequency::Weekly);
    QCOMPARE(weekly.daysOfWeek(), (QVector<int>{ 2 }));

    const auto secondTuesday = RecurrenceRule::defaultMonthlyRule(QStringLiteral("2026-03-10"));
    const auto pattern = std::get<WeekdayOfMonthPattern>(*secondTuesday.monthlyPattern());
    QCOMPARE(pattern.weekday, 2);
    QCOMPARE(pattern.occurrence, 2);

    const auto lastThursday = RecurrenceRule::defaultMonthlyRule(QStringLiteral("2026-01-29"));
    QCOMPARE(std::get<WeekdayOfMonthPattern>(*lastThursday.monthlyPattern()).occurrence,
             WeekdayOfMonthPattern::Last);
}

QTEST_APPLESS_MAIN(RecurrenceRuleTest)
#include "RecurrenceRuleTest.moc"
