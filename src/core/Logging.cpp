#include "timebox/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcEngine, "timebox.engine", QtInfoMsg)
Q_LOGGING_CATEGORY(lcData, "timebox.data", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSync, "timebox.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCore, "timebox.core", QtInfoMsg)
