#include "DockKitLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "dockkit.app")       // Application: startup, workspace, config
Q_LOGGING_CATEGORY(logPane, "dockkit.pane")     // Pane: content, close protocol, container membership
Q_LOGGING_CATEGORY(logFocus, "dockkit.focus")   // Focus: activation chain, deferred click checks
Q_LOGGING_CATEGORY(logDebug, "dockkit.debug", QtWarningMsg)  // Debug: disabled by default
