#include "FocusScopeWidget.hpp"
#include "DockKitLogging.hpp"
#include <QApplication>

FocusScopeWidget::FocusScopeWidget(QWidget* parent)
    : QWidget(parent)
{
    connect(qApp, &QApplication::focusChanged, this, &FocusScopeWidget::onApplicationFocusChanged);
}

QWidget* FocusScopeWidget::lastFocusedWidget() const {
    // Widgets moved out of the scope since they were remembered do not count
    QWidget* w = m_lastFocused.data();
    return (w && isAncestorOf(w)) ? w : nullptr;
}

void FocusScopeWidget::setLastFocusedWidget(QWidget* widget) {
    if (widget && !isAncestorOf(widget)) {
        dkLog_Debug("FocusScopeWidget: ignoring widget outside the scope" << widget);
        return;
    }
    if (m_lastFocused == widget) return;
    m_lastFocused = widget;
    emit lastFocusedWidgetChanged(widget);
}

void FocusScopeWidget::onApplicationFocusChanged(QWidget* /*old*/, QWidget* now) {
    if (now && isAncestorOf(now)) {
        setLastFocusedWidget(now);
    }
}
