#pragma once

class DockPane;

/// Ancestor widgets implementing this receive a pane's closed notification.
class IPaneClosedListener {
public:
    virtual ~IPaneClosedListener() = default;
    virtual void onPaneClosed(DockPane* pane) = 0;
};
