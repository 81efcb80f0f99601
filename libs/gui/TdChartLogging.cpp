#include "TdChartLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "tdchart.app")
Q_LOGGING_CATEGORY(logData, "tdchart.data")
Q_LOGGING_CATEGORY(logRender, "tdchart.render")
Q_LOGGING_CATEGORY(logDebug, "tdchart.debug", QtWarningMsg)
