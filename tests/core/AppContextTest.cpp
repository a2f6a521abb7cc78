#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "cadence/core/AppContext.hpp"
#include "cadence/core/SeriesService.hpp"
#include "cadence/data/InstanceRepository.hpp"
#include "cadence/data/SeriesRepository.hpp"

using namespace cadence;

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void servicesShareOneStore();
};

void AppContextTest::servicesShareOneStore()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("series.ics"));

    core::ReconcilerSettings settings;
    settings.initialHorizonMonths = 1;

    QUuid id;
    {
        core::AppContext context(path, settings);
        QCOMPARE(context.storagePath(), path);
        QCOMPARE(context.seriesService().reconciler().settings().initialHorizonMonths, 1);

        data::SeriesTemplate series;
        series.name = QStringLiteral("Book Club");
        series.rule = core::RecurrenceRule::defaultMonthlyRule(QStringLiteral("2026-01-13"));
        series.startDate = QStringLiteral("2026-01-13");
        const auto result = context.seriesService().createSeries(series, QStringLiteral("2026-01-12"), &id);
        QVERIFY(result.success);
        QCOMPARE(result.created, 2);
        QVERIFY(context.seriesRepository().findById(id).has_value());
    }

    core::AppContext reopened(path);
    QCOMPARE(reopened.instanceRepository().fetchInstances(id).size(), static_cast<size_t>(2));
    QCOMPARE(reopened.instanceRepository().fetchInstances(id).back().instanceDate, QStringLiteral("2026-02-10"));
}

QTEST_APPLESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
