#pragma once

class QSettings;

namespace cadence {
namespace core {

// How many months ahead of "today" each reconciliation materializes.
struct ReconcilerSettings
{
    int initialHorizonMonths = 3;
    int extendHorizonMonths = 6;
    int regenerateHorizonMonths = 3;

    static ReconcilerSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace cadence
