#include "TabulaLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "tabula.app")         // Application: init, lifecycle, config
Q_LOGGING_CATEGORY(logData, "tabula.data")       // Data: provider, fetches, sessions, table store
Q_LOGGING_CATEGORY(logRender, "tabula.render")   // Render: scale mapping, windows, painting
Q_LOGGING_CATEGORY(logDebug, "tabula.debug", QtWarningMsg)  // Debug: disabled by default
