#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "cadence/core/AppContext.hpp"
#include "cadence/core/DateMath.hpp"
#include "cadence/core/OccurrenceGenerator.hpp"
#include "cadence/core/RecurrenceDescriber.hpp"
#include "cadence/core/RecurrenceRule.hpp"
#include "cadence/core/SeriesService.hpp"
#include "cadence/data/InstanceRepository.hpp"
#include "cadence/data/SeriesRepository.hpp"

using namespace cadence;

namespace {

enum ExitCode
{
    ExitOk = 0,
    ExitFailure = 1,
    ExitUsage = 2,
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int usageError(const QString &message)
{
    err() << message << '\n';
    err().flush();
    return ExitUsage;
}

int report(const core::SeriesActionResult &result)
{
    (result.success ? out() : err()) << result.message << '\n';
    return result.success ? ExitOk : ExitFailure;
}

std::optional<QUuid> parseSeriesId(const QString &value)
{
    const QString withBraces = value.startsWith('{') ? value : QStringLiteral("{%1}").arg(value);
    const QUuid id(withBraces);
    if (id.isNull()) {
        return std::nullopt;
    }
    return id;
}

QByteArray readInput(const QString &path, QString *errorString)
{
    QFile file;
    bool opened = false;
    if (path == QLatin1String("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        *errorString = file.errorString();
        return {};
    }
    return file.readAll();
}

void printInstance(const data::EventInstance &instance)
{
    out() << instance.instanceDate << "  " << instance.slug;
    if (instance.isException) {
        out() << "  [exception]";
    }
    if (instance.hasRegistrations()) {
        out() << "  (" << instance.registrationCount << " registered)";
    }
    out() << '\n';
}

int runDescribe(const QStringList &args)
{
    if (args.size() != 1) {
        return usageError(QStringLiteral("usage: cadence describe <rule-json>"));
    }
    QString error;
    const auto rule = core::RecurrenceRule::fromJson(args.front().toUtf8(), &error);
    if (!rule) {
        return usageError(error);
    }
    out() << core::describeRecurrenceRule(*rule) << '\n';
    return ExitOk;
}

int runGenerate(const QCommandLineParser &parser, const QStringList &args)
{
    if (args.size() != 2 || !parser.isSet(QStringLiteral("until"))) {
        return usageError(QStringLiteral("usage: cadence generate <rule-json> <start> --until <date> [--end <date> | --count <n>]"));
    }
    QString error;
    const auto rule = core::RecurrenceRule::fromJson(args.at(0).toUtf8(), &error);
    if (!rule) {
        return usageError(error);
    }

    core::GenerationBounds bounds;
    bounds.startDate = args.at(1);
    bounds.generateUntil = parser.value(QStringLiteral("until"));
    if (parser.isSet(QStringLiteral("end"))) {
        bounds.endDate = parser.value(QStringLiteral("end"));
    }
    if (parser.isSet(QStringLiteral("count"))) {
        bool ok = false;
        bounds.maxOccurrences = parser.value(QStringLiteral("count")).toInt(&ok);
        if (!ok || *bounds.maxOccurrences <= 0) {
            return usageError(QStringLiteral("--count must be a positive number"));
        }
    }
    if (bounds.endDate && bounds.maxOccurrences) {
        return usageError(QStringLiteral("--end and --count are mutually exclusive"));
    }
    if (!core::dates::isValid(bounds.startDate) || !core::dates::isValid(bounds.generateUntil)
        || (bounds.endDate && !core::dates::isValid(*bounds.endDate))) {
        return usageError(QStringLiteral("dates must be given as YYYY-MM-DD"));
    }

    for (const QString &date : core::OccurrenceGenerator(*rule).generate(bounds)) {
        out() << date << '\n';
    }
    return ExitOk;
}

int runCreate(core::AppContext &context, const QString &today, const QStringList &args)
{
    if (args.size() != 1) {
        return usageError(QStringLiteral("usage: cadence create <series-json-file | ->"));
    }
    QString error;
    const QByteArray input = readInput(args.front(), &error);
    if (!error.isEmpty()) {
        return usageError(error);
    }
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(input, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        return usageError(QStringLiteral("series must be a JSON object: %1").arg(parseError.errorString()));
    }
    const auto series = data::SeriesTemplate::fromJsonObject(document.object(), &error);
    if (!series) {
        return usageError(error);
    }

    QUuid id;
    const auto result = context.seriesService().createSeries(*series, today, &id);
    if (result.success) {
        out() << id.toString(QUuid::WithoutBraces) << '\n';
    }
    return report(result);
}

int runList(core::AppContext &context)
{
    for (const auto &series : context.seriesRepository().fetchSeries()) {
        out() << series.id.toString(QUuid::WithoutBraces) << "  " << data::seriesStatusToString(series.status)
              << "  " << series.name << "  " << core::describeRecurrenceRule(series.rule) << '\n';
    }
    return ExitOk;
}

int runInstances(core::AppContext &context, const QUuid &seriesId)
{
    if (!context.seriesRepository().findById(seriesId)) {
        err() << "Series not found\n";
        return ExitFailure;
    }
    for (const auto &instance : context.instanceRepository().fetchInstances(seriesId)) {
        printInstance(instance);
    }
    return ExitOk;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Cadence"));
    QCoreApplication::setApplicationName(QStringLiteral("cadence"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kCadenceVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Materializes recurring event series."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        { QStringLiteral("store"), QStringLiteral("Series store file."), QStringLiteral("file") },
        { QStringLiteral("today"), QStringLiteral("Date to treat as today (YYYY-MM-DD)."), QStringLiteral("date") },
        { QStringLiteral("until"), QStringLiteral("Generation horizon for 'generate'."), QStringLiteral("date") },
        { QStringLiteral("end"), QStringLiteral("End date for 'generate'."), QStringLiteral("date") },
        { QStringLiteral("count"), QStringLiteral("Maximum occurrences for 'generate'."), QStringLiteral("n") },
        { { QStringLiteral("v"), QStringLiteral("verbose") }, QStringLiteral("Log engine details.") },
    });
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("describe, generate, create, list, instances, extend, "
                                                "regenerate, pause, resume, end or delete."));
    parser.process(app);

    if (parser.isSet(QStringLiteral("verbose"))) {
        QLoggingCategory::setFilterRules(QStringLiteral("cadence.*.debug=true"));
    }

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(ExitUsage);
    }
    const QString command = args.takeFirst();

    if (command == QLatin1String("describe")) {
        return runDescribe(args);
    }
    if (command == QLatin1String("generate")) {
        return runGenerate(parser, args);
    }

    QString today = parser.value(QStringLiteral("today"));
    if (today.isEmpty()) {
        const QDate current = QDate::currentDate();
        today = core::dates::fromParts(current.year(), current.month(), current.day());
    } else if (!core::dates::isValid(today)) {
        return usageError(QStringLiteral("--today must be a YYYY-MM-DD date"));
    }

    QSettings settings;
    core::AppContext context(parser.value(QStringLiteral("store")), core::ReconcilerSettings::load(settings));
    auto &service = context.seriesService();

    if (command == QLatin1String("create")) {
        return runCreate(context, today, args);
    }
    if (command == QLatin1String("list")) {
        return runList(context);
    }
    if (command == QLatin1String("extend") && args.isEmpty()) {
        return report(service.extendActiveSeries(today));
    }

    if (args.size() != 1) {
        return usageError(QStringLiteral("usage: cadence %1 <series-id>").arg(command));
    }
    const auto seriesId = parseSeriesId(args.front());
    if (!seriesId) {
        return usageError(QStringLiteral("invalid series id \"%1\"").arg(args.front()));
    }

    if (command == QLatin1String("instances")) {
        return runInstances(context, *seriesId);
    }
    if (command == QLatin1String("extend")) {
        return report(service.generateMore(*seriesId, today));
    }
    if (command == QLatin1String("regenerate")) {
        return report(service.regenerate(*seriesId, today));
    }
    if (command == QLatin1String("pause")) {
        return report(service.setStatus(*seriesId, data::SeriesStatus::Paused));
    }
    if (command == QLatin1String("resume")) {
        return report(service.setStatus(*seriesId, data::SeriesStatus::Active));
    }
    if (command == QLatin1String("end")) {
        return report(service.setStatus(*seriesId, data::SeriesStatus::Ended));
    }
    if (command == QLatin1String("delete")) {
        return report(service.deleteSeries(*seriesId, today));
    }
    return usageError(QStringLiteral("unknown command \"%1\"").arg(command));
}
