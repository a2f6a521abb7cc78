#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcCadenceDates)
Q_DECLARE_LOGGING_CATEGORY(lcCadenceRule)
Q_DECLARE_LOGGING_CATEGORY(lcCadenceGenerator)
Q_DECLARE_LOGGING_CATEGORY(lcCadenceReconciler)
Q_DECLARE_LOGGING_CATEGORY(lcCadenceStorage)
Q_DECLARE_LOGGING_CATEGORY(lcCadenceService)
