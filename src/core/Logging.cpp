#include "cadence/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcCadenceDates, "cadence.dates", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCadenceRule, "cadence.rule", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCadenceGenerator, "cadence.generator", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCadenceReconciler, "cadence.reconciler", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCadenceStorage, "cadence.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCadenceService, "cadence.service", QtInfoMsg)
