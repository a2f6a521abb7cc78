#pragma once

#include <QString>

#include "cadence/core/RecurrenceRule.hpp"

namespace cadence {
namespace core {

// Display text only; nothing parses it back.
QString describeRecurrenceRule(const RecurrenceRule &rule);

QString frequencyLabel(Frequency frequency);
QString weekdayName(int weekday);
QString weekdayShortName(int weekday);
QString occurrenceLabel(int occurrence);
QString ordinalSuffix(int number);

} // namespace core
} // namespace cadence
