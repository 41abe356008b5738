#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// TABULA LOGGING CATEGORIES
// =============================================================================
// Four categories, each with atomic throttling for high-frequency call sites

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: init, lifecycle, config
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: provider, fetches, sessions, table store
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: scale mapping, windows, painting, scrolling
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING
// =============================================================================

namespace tabula::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // Log every app event (low frequency)
    inline constexpr int kData   = 20;   // Log every 20th data operation
    inline constexpr int kRender = 100;  // Log every 100th render operation (scroll ticks)
    inline constexpr int kDebug  = 10;   // Log every 10th debug message
}

// Atomic throttling macro with runtime env var override
#define TLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("TABULA_LOG_" #cat "_INTERVAL");          \
            const int v = env ? std::atoi(env) : (defaultInterval);                  \
            return v > 0 ? v : 1;                                                    \
        }();                                                                         \
        if (_interval == 1 || (++_counter % _interval) == 1) {                       \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

// Primary logging macros (automatically throttled for hot paths)
#define tLog_App(...)     TLOG_THROTTLED(App, tabula::log_throttle::kApp, __VA_ARGS__)
#define tLog_Data(...)    TLOG_THROTTLED(Data, tabula::log_throttle::kData, __VA_ARGS__)
#define tLog_Render(...)  TLOG_THROTTLED(Render, tabula::log_throttle::kRender, __VA_ARGS__)
#define tLog_Debug(...)   TLOG_THROTTLED(Debug, tabula::log_throttle::kDebug, __VA_ARGS__)

// Override macros for specific throttle intervals
#define tLog_AppN(n, ...)    TLOG_THROTTLED(App, n, __VA_ARGS__)
#define tLog_DataN(n, ...)   TLOG_THROTTLED(Data, n, __VA_ARGS__)
#define tLog_RenderN(n, ...) TLOG_THROTTLED(Render, n, __VA_ARGS__)
#define tLog_DebugN(n, ...)  TLOG_THROTTLED(Debug, n, __VA_ARGS__)

// Always-on macros (no throttling for critical messages)
#define tLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define tLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

// =============================================================================
// RUNTIME CONTROL
// =============================================================================
//   export TABULA_LOG_Data_INTERVAL=1      # See every fetch
//   export TABULA_LOG_Render_INTERVAL=10   # See every 10th scroll tick
//   export QT_LOGGING_RULES="tabula.*.debug=true"
