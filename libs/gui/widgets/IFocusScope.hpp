#pragma once

class QWidget;

/**
 * A content subtree that remembers which of its descendants last held focus.
 * DockPane::activate() restores that widget before falling back to the first
 * focusable one.
 */
class IFocusScope {
public:
    virtual ~IFocusScope() = default;
    virtual QWidget* lastFocusedWidget() const = 0;
};
