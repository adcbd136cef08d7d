#pragma once

#include <QFrame>
#include <QList>
#include <QPointer>
#include <QString>

class QAction;
class QVBoxLayout;
class IDockPaneContainer;

/**
 * A single dockable pane: hosts one content widget, carries a title and a
 * tab label, and can be closed, selected and focus-activated as a unit
 * within the IDockPaneContainer found among its widget ancestors.
 */
class DockPane : public QFrame {
    Q_OBJECT
    Q_PROPERTY(QString title READ title WRITE setTitle NOTIFY titleChanged)
    Q_PROPERTY(QString tabLabel READ tabLabel WRITE setTabLabel NOTIFY tabLabelChanged)
    Q_PROPERTY(bool selected READ isSelected NOTIFY selectedChanged)
    Q_PROPERTY(double contentSize READ contentSize WRITE setContentSize NOTIFY contentSizeChanged)
    Q_PROPERTY(bool allowClose READ allowClose WRITE setAllowClose NOTIFY allowCloseChanged)

public:
    explicit DockPane(QWidget* parent = nullptr);
    explicit DockPane(const QString& title, QWidget* parent = nullptr);
    ~DockPane() override;

    QString title() const { return m_title; }

    /**
     * Sets the title. A tab label that still equals the previous title
     * follows it; a customized tab label is left alone.
     */
    void setTitle(const QString& title);

    QString tabLabel() const { return m_tabLabel; }
    void setTabLabel(const QString& label);

    bool isSelected() const { return m_selected; }

    /**
     * Selection flag, written by the owning container only.
     */
    void setSelected(bool selected);

    double contentSize() const { return m_contentSize; }

    /**
     * Values that are not strictly positive are ignored.
     */
    void setContentSize(double size);

    bool allowClose() const { return m_allowClose; }
    void setAllowClose(bool allow);

    QWidget* content() const { return m_content.data(); }

    /**
     * Replaces the hosted widget. The pane reparents the new content into
     * itself; the previous content is hidden and handed back to the caller
     * without a parent (it is not deleted).
     */
    void setContent(QWidget* content);

    /**
     * Nearest ancestor implementing IDockPaneContainer, or nullptr.
     */
    IDockPaneContainer* findParentContainer() const;

    /**
     * Cancelable close. Emits closing(), removes the pane from its container
     * (asking an emptied container to remove itself), then emits closed() and
     * notifies ancestor IPaneClosedListener widgets.
     * Returns false when a listener canceled or the pane was already closed.
     * A closed() slot that deletes the pane outright ends the notification
     * there; ancestors are not told. Prefer deleteLater() or WA_DeleteOnClose.
     */
    bool closePane();
    bool isClosed() const { return m_closed; }

    /**
     * Moves focus into the pane unless it already holds it. Tries, in order:
     * the focus scope's remembered widget, the first focusable widget of the
     * content, the pane itself. Returns true if focus moved.
     */
    bool activate();

    /**
     * Makes this the container's selected pane (re-laying out only when the
     * selection changes), then activates it if moveFocus is set.
     */
    void selectAndActivate(bool moveFocus = true);

    bool containsFocus() const;

    /**
     * Close command for menus, buttons and shortcuts; enabled while allowClose is set.
     */
    QAction* closeAction() const { return m_closeAction; }

signals:
    void titleChanged(const QString& title);
    void tabLabelChanged(const QString& label);
    void selectedChanged(bool selected);
    void contentSizeChanged(double size);
    void allowCloseChanged(bool allow);
    void contentChanged(QWidget* content);

    /**
     * Raised before removal. Listeners must use a direct connection and may
     * set *cancel to true to keep the pane.
     */
    void closing(DockPane* pane, bool* cancel);
    void closed(DockPane* pane);

protected:
    bool event(QEvent* event) override;
    bool eventFilter(QObject* watched, QEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;

private:
    void attachContent(QWidget* content);
    void detachContent(QWidget* content);
    void watchForPresses(QWidget* widget);
    void unwatchForPresses(QWidget* widget);
    void scheduleDeferredActivation();
    bool tryFocus(QWidget* widget);
    QWidget* firstFocusableIn(QWidget* root) const;
    QList<QPointer<QWidget>> closedListenerAncestors() const;

    static QEvent::Type deferredActivationEventType();

    QString m_title;
    QString m_tabLabel;
    bool m_selected = false;
    double m_contentSize;
    bool m_allowClose = true;
    bool m_closed = false;
    bool m_activationPending = false;

    QPointer<QWidget> m_content;
    QVBoxLayout* m_layout = nullptr;
    QAction* m_closeAction = nullptr;
};
