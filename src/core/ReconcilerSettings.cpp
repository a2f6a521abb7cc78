#include "cadence/core/ReconcilerSettings.hpp"

#include "cadence/core/Logging.hpp"

#include <QSettings>

namespace cadence {
namespace core {

namespace {
constexpr auto GROUP = "horizon";
constexpr auto INITIAL_KEY = "initialMonths";
constexpr auto EXTEND_KEY = "extendMonths";
constexpr auto REGENERATE_KEY = "regenerateMonths";

int readMonths(QSettings &settings, const char *key, int fallback)
{
    bool ok = false;
    const int value = settings.value(QLatin1String(key), fallback).toInt(&ok);
    if (!ok || value <= 0) {
        qCWarning(lcCadenceService) << "ignoring horizon setting" << key << "=" << settings.value(QLatin1String(key));
        return fallback;
    }
    return value;
}
} // namespace

ReconcilerSettings ReconcilerSettings::load(QSettings &settings)
{
    const ReconcilerSettings defaults;
    ReconcilerSettings loaded;
    settings.beginGroup(QLatin1String(GROUP));
    loaded.initialHorizonMonths = readMonths(settings, INITIAL_KEY, defaults.initialHorizonMonths);
    loaded.extendHorizonMonths = readMonths(settings, EXTEND_KEY, defaults.extendHorizonMonths);
    loaded.regenerateHorizonMonths = readMonths(settings, REGENERATE_KEY, defaults.regenerateHorizonMonths);
    settings.endGroup();
    return loaded;
}

void ReconcilerSettings::save(QSettings &settings) const
{
    settings.beginGroup(QLatin1String(GROUP));
    settings.setValue(QLatin1String(INITIAL_KEY), initialHorizonMonths);
    settings.setValue(QLatin1String(EXTEND_KEY), extendHorizonMonths);
    settings.setValue(QLatin1String(REGENERATE_KEY), regenerateHorizonMonths);
    settings.endGroup();
}

} // namespace core
} // namespace cadence
