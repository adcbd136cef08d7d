#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// DOCKKIT LOGGING CATEGORIES
// =============================================================================
// Four categories, each with atomic throttling for chatty call sites

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: startup, workspace, config
Q_DECLARE_LOGGING_CATEGORY(logPane)     // Pane: content, close protocol, container membership
Q_DECLARE_LOGGING_CATEGORY(logFocus)    // Focus: activation chain, deferred click checks
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING SYSTEM
// =============================================================================

namespace dockkit::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp   = 1;    // Log every app event
    inline constexpr int kPane  = 1;    // Log every pane lifecycle event
    inline constexpr int kFocus = 10;   // Log every 10th focus attempt (fires on every click)
    inline constexpr int kDebug = 10;   // Log every 10th debug message
}

// Atomic throttling macro with runtime env var override
#define DKLOG_THROTTLED(cat, defaultInterval, ...)                                  \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("DOCKKIT_LOG_" #cat "_INTERVAL");          \
            const int parsed = env ? std::atoi(env) : (defaultInterval);             \
            return parsed > 0 ? parsed : 1;                                          \
        }();                                                                         \
        if ((++_counter % _interval) == 1 % _interval) {                             \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

// Primary logging macros (throttled)
#define dkLog_App(...)    DKLOG_THROTTLED(App, dockkit::log_throttle::kApp, __VA_ARGS__)
#define dkLog_Pane(...)   DKLOG_THROTTLED(Pane, dockkit::log_throttle::kPane, __VA_ARGS__)
#define dkLog_Focus(...)  DKLOG_THROTTLED(Focus, dockkit::log_throttle::kFocus, __VA_ARGS__)
#define dkLog_Debug(...)  DKLOG_THROTTLED(Debug, dockkit::log_throttle::kDebug, __VA_ARGS__)

// Always-on macros (no throttling)
#define dkLog_Warning(...)  qCWarning(logPane) << __VA_ARGS__
#define dkLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

// =============================================================================
// RUNTIME CONTROL
// =============================================================================
//   export DOCKKIT_LOG_Focus_INTERVAL=1        # See every focus attempt
//   export QT_LOGGING_RULES="dockkit.*.debug=true"
