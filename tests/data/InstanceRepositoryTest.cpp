#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "cadence/data/FileInstanceRepository.hpp"
#include "cadence/data/FileSeriesRepository.hpp"
#include "cadence/data/InMemoryInstanceRepository.hpp"
#include "cadence/data/InMemorySeriesRepository.hpp"

using namespace cadence;
using namespace cadence::data;

namespace {

EventInstance makeInstance(const QUuid &seriesId, const QString &date, const QString &slug)
{
    EventInstance instance;
    instance.seriesId = seriesId;
    instance.instanceDate = date;
    instance.slug = slug;
    instance.name = QStringLiteral("Open Mic");
    return instance;
}

void checkAddAndFetch(InstanceRepository &repo)
{
    const QUuid seriesId = QUuid::createUuid();
    repo.addInstance(makeInstance(seriesId, QStringLiteral("2026-01-13"), QStringLiteral("open-mic-2026-01-13")));
    const auto stored
        = repo.addInstance(makeInstance(seriesId, QStringLiteral("2026-01-06"), QStringLiteral("open-mic-2026-01-06")));
    repo.addInstance(makeInstance(QUuid::createUuid(), QStringLiteral("2026-01-01"), QStringLiteral("other-2026-01-01")));

    QVERIFY(!stored.id.isNull());

    const auto list = repo.fetchInstances(seriesId);
    QCOMPARE(list.size(), static_cast<size_t>(2));
    QCOMPARE(list.front().instanceDate, QStringLiteral("2026-01-06"));
    QCOMPARE(list.back().instanceDate, QStringLiteral("2026-01-13"));

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->slug, QStringLiteral("open-mic-2026-01-06"));

    const auto bySlug = repo.findBySlug(QStringLiteral("other-2026-01-01"));
    QVERIFY(bySlug.has_value());
    QCOMPARE(bySlug->instanceDate, QStringLiteral("2026-01-01"));
    QVERIFY(!repo.findBySlug(QStringLiteral("missing")).has_value());

    QCOMPARE(repo.slugs(),
             QSet<QString>({ "open-mic-2026-01-06", "open-mic-2026-01-13", "other-2026-01-01" }));
}

void checkUpdateAndRemove(InstanceRepository &repo)
{
    const auto stored = repo.addInstance(
        makeInstance(QUuid::createUuid(), QStringLiteral("2026-02-03"), QStringLiteral("open-mic-2026-02-03")));

    EventInstance toUpdate = stored;
    toUpdate.registrationCount = 3;
    toUpdate.isException = true;
    QVERIFY(repo.updateInstance(toUpdate));

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QVERIFY(fetched->hasRegistrations());
    QVERIFY(fetched->isException);

    EventInstance unknown = stored;
    unknown.id = QUuid::createUuid();
    QVERIFY(!repo.updateInstance(unknown));

    QVERIFY(repo.removeInstance(stored.id));
    QVERIFY(!repo.findById(stored.id).has_value());
    QVERIFY(!repo.removeInstance(stored.id));
}

} // namespace

class InstanceRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void inMemoryAddAndFetch();
    void inMemoryUpdateAndRemove();
    void fileAddAndFetch();
    void fileUpdateAndRemove();
    void seriesRepositoryRoundTrip();
};

void InstanceRepositoryTest::inMemoryAddAndFetch()
{
    InMemoryInstanceRepository repo;
    checkAddAndFetch(repo);
}

void InstanceRepositoryTest::inMemoryUpdateAndRemove()
{
    InMemoryInstanceRepository repo;
    checkUpdateAndRemove(repo);
}

void InstanceRepositoryTest::fileAddAndFetch()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    FileInstanceRepository repo(std::make_shared<FileSeriesStorage>(dir.filePath(QStringLiteral("series.ics"))));
    checkAddAndFetch(repo);
}

void InstanceRepositoryTest::fileUpdateAndRemove()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    FileInstanceRepository repo(std::make_shared<FileSeriesStorage>(dir.filePath(QStringLiteral("series.ics"))));
    checkUpdateAndRemove(repo);
}

void InstanceRepositoryTest::seriesRepositoryRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    InMemorySeriesRepository memory;
    FileSeriesRepository file(std::make_shared<FileSeriesStorage>(dir.filePath(QStringLiteral("series.ics"))));

    for (SeriesRepository *repo : { static_cast<SeriesRepository *>(&memory), static_cast<SeriesRepository *>(&file) }) {
        SeriesTemplate series;
        series.name = QStringLiteral("Initial");
        series.startDate = QStringLiteral("2026-01-06");
        const auto stored = repo->addSeries(series);
        QCOMPARE(repo->fetchSeries().size(), static_cast<size_t>(1));

        SeriesTemplate toUpdate = stored;
        toUpdate.name = QStringLiteral("Updated");
        toUpdate.status = SeriesStatus::Paused;
        QVERIFY(repo->updateSeries(toUpdate));

        const auto fetched = repo->findById(stored.id);
        QVERIFY(fetched.has_value());
        QCOMPARE(fetched->name, QStringLiteral("Updated"));
        QCOMPARE(fetched->status, SeriesStatus::Paused);

        QVERIFY(repo->removeSeries(stored.id));
        QVERIFY(!repo->findById(stored.id).has_value());
    }
}

QTEST_APPLESS_MAIN(InstanceRepositoryTest)
#include "InstanceRepositoryTest.moc"
