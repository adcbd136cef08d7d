#pragma once

#include <QKeySequence>
#include <QString>

/**
 * Persistent pane preferences backed by QSettings (group "panes").
 * Uses the application's organization/application names, so tests and the
 * demo keep separate stores.
 */
class PaneSettings {
public:
    static constexpr double DEFAULT_CONTENT_SIZE = 225.0;

    /**
     * Content size given to newly created panes.
     * Stored values that are not strictly positive fall back to DEFAULT_CONTENT_SIZE.
     */
    static double defaultContentSize();

    /**
     * Returns false (and stores nothing) for non-positive sizes.
     */
    static bool setDefaultContentSize(double size);

    /**
     * Shortcut bound to every pane's close action.
     */
    static QKeySequence closeShortcut();
    static void setCloseShortcut(const QKeySequence& shortcut);

    /**
     * Remove all stored pane preferences.
     */
    static void reset();
};
