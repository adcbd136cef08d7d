#pragma once

class DockPane;

/**
 * Capabilities a DockPane needs from the group that holds it.
 * Implemented by the layout collaborator (DockPaneGroup in this library).
 * A pane discovers its container by walking its widget parents; it never stores one.
 */
class IDockPaneContainer {
public:
    virtual ~IDockPaneContainer() = default;

    virtual void removeMember(DockPane* pane) = 0;
    virtual int memberCount() const = 0;

    /// Remove this container from its own parent (cascading collapse, one level).
    virtual void removeSelf() = 0;

    virtual void setSelectedPane(DockPane* pane) = 0;
    virtual DockPane* selectedPane() const = 0;
    virtual void requestRelayout() = 0;
};
