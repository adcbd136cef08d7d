#pragma once

#include "IFocusScope.hpp"
#include <QPointer>
#include <QWidget>

/**
 * Plain container widget that acts as a focus scope for its descendants.
 * Tracks QApplication::focusChanged; hosts restoring a saved state can seed
 * the memory with setLastFocusedWidget().
 */
class FocusScopeWidget : public QWidget, public IFocusScope {
    Q_OBJECT

public:
    explicit FocusScopeWidget(QWidget* parent = nullptr);

    QWidget* lastFocusedWidget() const override;
    void setLastFocusedWidget(QWidget* widget);

signals:
    void lastFocusedWidgetChanged(QWidget* widget);

private slots:
    void onApplicationFocusChanged(QWidget* old, QWidget* now);

private:
    QPointer<QWidget> m_lastFocused;
};
