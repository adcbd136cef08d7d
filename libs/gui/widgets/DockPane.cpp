#include "DockPane.hpp"
#include "IDockPaneContainer.hpp"
#include "IFocusScope.hpp"
#include "IPaneClosedListener.hpp"
#include "PaneSettings.hpp"
#include "DockKitLogging.hpp"
#include <QAction>
#include <QChildEvent>
#include <QCoreApplication>
#include <QMouseEvent>
#include <QVBoxLayout>
#include <cmath>

namespace {

bool acceptsTabFocus(const QWidget* w) {
    if ((w->focusPolicy() & Qt::TabFocus) != Qt::TabFocus) return false;
    if (!w->isEnabled()) return false;
    return w->isWindow() || w->isVisibleTo(w->window());
}

QWidget* deepestFocusProxy(QWidget* w) {
    while (w->focusProxy()) w = w->focusProxy();
    return w;
}

}

DockPane::DockPane(QWidget* parent)
    : QFrame(parent)
    , m_contentSize(PaneSettings::defaultContentSize())
{
    setFrameShape(QFrame::NoFrame);

    m_layout = new QVBoxLayout(this);
    m_layout->setContentsMargins(0, 0, 0, 0);
    m_layout->setSpacing(0);

    m_closeAction = new QAction(tr("Close"), this);
    m_closeAction->setShortcut(PaneSettings::closeShortcut());
    m_closeAction->setShortcutContext(Qt::WidgetWithChildrenShortcut);
    m_closeAction->setEnabled(m_allowClose);
    addAction(m_closeAction);
    connect(m_closeAction, &QAction::triggered, this, [this]() {
        if (!closePane()) {
            dkLog_Pane("Close command did not close pane" << m_title);
        }
    });
}

DockPane::DockPane(const QString& title, QWidget* parent)
    : DockPane(parent)
{
    setTitle(title);
}

DockPane::~DockPane() {
    if (m_content) {
        unwatchForPresses(m_content);
    }
}

void DockPane::setTitle(const QString& title) {
    if (m_title == title) return;

    const QString previous = m_title;
    m_title = title;
    m_closeAction->setText(title.isEmpty() ? tr("Close") : tr("Close %1").arg(title));
    emit titleChanged(m_title);

    // A label that was never customized keeps mirroring the title
    if (QString::localeAwareCompare(m_tabLabel, previous) == 0) {
        setTabLabel(title);
    }
}

void DockPane::setTabLabel(const QString& label) {
    if (m_tabLabel == label) return;
    m_tabLabel = label;
    emit tabLabelChanged(m_tabLabel);
}

void DockPane::setSelected(bool selected) {
    if (m_selected == selected) return;
    m_selected = selected;
    emit selectedChanged(m_selected);
}

void DockPane::setContentSize(double size) {
    if (!std::isfinite(size) || size <= 0.0) {
        dkLog_Debug("Rejected content size" << size << "for pane" << m_title << "- keeping" << m_contentSize);
        return;
    }
    if (m_contentSize == size) return;
    m_contentSize = size;
    emit contentSizeChanged(m_contentSize);
}

void DockPane::setAllowClose(bool allow) {
    if (m_allowClose == allow) return;
    m_allowClose = allow;
    m_closeAction->setEnabled(allow);
    emit allowCloseChanged(m_allowClose);
}

void DockPane::setContent(QWidget* content) {
    if (m_content == content) return;
    if (content && (content == this || content->isAncestorOf(this))) {
        dkLog_Warning("DockPane: refusing to host an ancestor of itself as content");
        return;
    }

    if (QWidget* previous = m_content.data()) {
        detachContent(previous);
    }
    m_content = content;
    if (content) {
        attachContent(content);
    }

    dkLog_Pane("Pane" << m_title << "content ->" << content);
    emit contentChanged(content);
}

void DockPane::attachContent(QWidget* content) {
    m_layout->addWidget(content);
    content->show();
    watchForPresses(content);
}

void DockPane::detachContent(QWidget* content) {
    unwatchForPresses(content);
    m_layout->removeWidget(content);
    content->hide();
    content->setParent(nullptr);
}

void DockPane::watchForPresses(QWidget* widget) {
    widget->installEventFilter(this);
    for (QWidget* child : widget->findChildren<QWidget*>()) {
        child->installEventFilter(this);
    }
}

void DockPane::unwatchForPresses(QWidget* widget) {
    widget->removeEventFilter(this);
    for (QWidget* child : widget->findChildren<QWidget*>()) {
        child->removeEventFilter(this);
    }
}

IDockPaneContainer* DockPane::findParentContainer() const {
    for (QWidget* w = parentWidget(); w; w = w->parentWidget()) {
        if (auto* container = dynamic_cast<IDockPaneContainer*>(w)) {
            return container;
        }
    }
    return nullptr;
}

QList<QPointer<QWidget>> DockPane::closedListenerAncestors() const {
    QList<QPointer<QWidget>> listeners;
    for (QWidget* w = parentWidget(); w; w = w->parentWidget()) {
        if (dynamic_cast<IPaneClosedListener*>(w)) {
            listeners.append(w);
        }
    }
    return listeners;
}

bool DockPane::closePane() {
    if (m_closed) {
        dkLog_Warning("closePane() called on already closed pane" << m_title);
        return false;
    }

    bool cancel = false;
    emit closing(this, &cancel);
    if (cancel) {
        dkLog_Pane("Close of pane" << m_title << "canceled by listener");
        return false;
    }

    // Ancestors are unreachable once the container has detached us
    const QList<QPointer<QWidget>> listeners = closedListenerAncestors();

    if (IDockPaneContainer* container = findParentContainer()) {
        container->removeMember(this);
        if (container->memberCount() == 0) {
            dkLog_Pane("Last pane" << m_title << "closed, collapsing its container");
            container->removeSelf();
        }
    }

    m_closed = true;
    dkLog_Pane("Pane" << m_title << "closed");

    QPointer<DockPane> self(this);
    emit closed(this);
    if (!self) {
        // A closed slot deleted the pane; ancestors get no dangling pointer
        return true;
    }
    for (const QPointer<QWidget>& w : listeners) {
        if (auto* listener = dynamic_cast<IPaneClosedListener*>(w.data())) {
            listener->onPaneClosed(this);
        }
    }

    if (testAttribute(Qt::WA_DeleteOnClose)) {
        deleteLater();
    }
    return true;
}

bool DockPane::containsFocus() const {
    const QWidget* focused = window()->focusWidget();
    return focused && (focused == this || isAncestorOf(focused));
}

bool DockPane::tryFocus(QWidget* widget) {
    if (!widget->isEnabled()) return false;
    if (!widget->isWindow() && !widget->isVisibleTo(widget->window())) return false;

    widget->setFocus(Qt::OtherFocusReason);
    return widget->window()->focusWidget() == deepestFocusProxy(widget);
}

QWidget* DockPane::firstFocusableIn(QWidget* root) const {
    // Focus chain order is the tab order of the window
    QWidget* w = root;
    do {
        if ((w == root || root->isAncestorOf(w)) && acceptsTabFocus(w)) {
            return w;
        }
        w = w->nextInFocusChain();
    } while (w && w != root);
    return nullptr;
}

bool DockPane::activate() {
    if (containsFocus()) {
        return false;
    }

    if (auto* scope = dynamic_cast<IFocusScope*>(m_content.data())) {
        if (QWidget* remembered = scope->lastFocusedWidget()) {
            if (tryFocus(remembered)) {
                dkLog_Focus("Pane" << m_title << "restored focus to" << remembered);
                return true;
            }
        }
    }

    if (m_content) {
        if (QWidget* first = firstFocusableIn(m_content)) {
            if (tryFocus(first)) {
                dkLog_Focus("Pane" << m_title << "focused first control" << first);
                return true;
            }
        }
    }

    if (focusPolicy() != Qt::NoFocus && tryFocus(this)) {
        dkLog_Focus("Pane" << m_title << "focused its own frame");
        return true;
    }

    dkLog_Focus("Pane" << m_title << "found nothing to focus");
    return false;
}

void DockPane::selectAndActivate(bool moveFocus) {
    if (IDockPaneContainer* container = findParentContainer()) {
        if (container->selectedPane() != this) {
            container->setSelectedPane(this);
            container->requestRelayout();
        }
    }
    if (moveFocus) {
        activate();
    }
}

QEvent::Type DockPane::deferredActivationEventType() {
    static const int type = QEvent::registerEventType();
    return static_cast<QEvent::Type>(type);
}

void DockPane::scheduleDeferredActivation() {
    if (m_activationPending || m_closed) return;
    m_activationPending = true;
    // Runs after pending layout and paint work
    QCoreApplication::postEvent(this, new QEvent(deferredActivationEventType()), Qt::LowEventPriority);
}

bool DockPane::event(QEvent* event) {
    if (event->type() == deferredActivationEventType()) {
        m_activationPending = false;
        if (!containsFocus()) {
            activate();
        }
        return true;
    }
    return QFrame::event(event);
}

bool DockPane::eventFilter(QObject* watched, QEvent* event) {
    switch (event->type()) {
    case QEvent::MouseButtonPress: {
        // Widgets that left the content keep the filter; ignore their presses
        auto* w = qobject_cast<QWidget*>(watched);
        if (w && m_content && (w == m_content || m_content->isAncestorOf(w))) {
            scheduleDeferredActivation();
        }
        break;
    }
    case QEvent::ChildAdded: {
        // Widgets added to the content later need the press hook as well
        QObject* child = static_cast<QChildEvent*>(event)->child();
        if (child->isWidgetType()) {
            child->installEventFilter(this);
            for (QWidget* grandChild : child->findChildren<QWidget*>()) {
                grandChild->installEventFilter(this);
            }
        }
        break;
    }
    default:
        break;
    }
    return QFrame::eventFilter(watched, event);
}

void DockPane::mousePressEvent(QMouseEvent* event) {
    // QWidget routes double clicks through here as well
    if (event->type() == QEvent::MouseButtonPress) {
        scheduleDeferredActivation();
    }
    QFrame::mousePressEvent(event);
}
