#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// TDCHART LOGGING CATEGORIES
// =============================================================================

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: init, lifecycle, config, registration
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: bar series loading, indicator recompute
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: overlay painting, coordinates
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// THROTTLING
// =============================================================================

namespace tdchart::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // every app event
    inline constexpr int kData   = 1;    // every recompute (one per series change)
    inline constexpr int kRender = 100;  // every 100th frame
    inline constexpr int kDebug  = 10;
}

// Per call site counter; interval read once from TDCHART_LOG_<cat>_INTERVAL
#define TLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static const uint32_t _interval = []() {                                     \
            const char* env = std::getenv("TDCHART_LOG_" #cat "_INTERVAL");         \
            const int value = env ? std::atoi(env) : (defaultInterval);             \
            return static_cast<uint32_t>(value > 0 ? value : 1);                    \
        }();                                                                         \
        if ((_counter++ % _interval) == 0) {                                        \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

#define tLog_App(...)     TLOG_THROTTLED(App, tdchart::log_throttle::kApp, __VA_ARGS__)
#define tLog_Data(...)    TLOG_THROTTLED(Data, tdchart::log_throttle::kData, __VA_ARGS__)
#define tLog_Render(...)  TLOG_THROTTLED(Render, tdchart::log_throttle::kRender, __VA_ARGS__)
#define tLog_Debug(...)   TLOG_THROTTLED(Debug, tdchart::log_throttle::kDebug, __VA_ARGS__)

#define tLog_RenderN(n, ...) TLOG_THROTTLED(Render, n, __VA_ARGS__)

// Always-on macros (no throttling)
#define tLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define tLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

/*
USAGE:
tLog_App("Registered indicator" << name);
tLog_Data("Recomputed" << name << "over" << bars << "bars");
tLog_Render("Overlay painted" << labels << "labels");

RUNTIME CONTROL:
export TDCHART_LOG_Render_INTERVAL=1        # see every frame
export QT_LOGGING_RULES="tdchart.*.debug=true"
*/
