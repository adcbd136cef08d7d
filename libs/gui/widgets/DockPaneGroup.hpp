#pragma once

#include "IDockPaneContainer.hpp"
#include <QList>
#include <QPointer>
#include <QWidget>

class DockPane;
class QStackedWidget;
class QTabBar;

/**
 * Tabbed group of DockPanes: a tab strip over a stack showing the selected pane.
 *
 * Tabs follow each pane's tab label and close permission. Tab close buttons
 * go through the pane's close action, so an allowClose == false pane cannot
 * be closed from the strip. When its last pane closes the group detaches
 * itself from its parent widget (and deletes itself if WA_DeleteOnClose).
 */
class DockPaneGroup : public QWidget, public IDockPaneContainer {
    Q_OBJECT

public:
    explicit DockPaneGroup(QWidget* parent = nullptr);
    ~DockPaneGroup() override;

    void addPane(DockPane* pane);
    QList<DockPane*> panes() const { return m_panes; }
    QTabBar* tabBar() const { return m_tabBar; }

    // IDockPaneContainer
    void removeMember(DockPane* pane) override;
    int memberCount() const override { return m_panes.size(); }
    void removeSelf() override;
    void setSelectedPane(DockPane* pane) override;
    DockPane* selectedPane() const override { return m_selected.data(); }
    void requestRelayout() override;

    int relayoutCount() const { return m_relayoutCount; }

signals:
    void selectedPaneChanged(DockPane* pane);
    void removedFromParent(DockPaneGroup* group);

private slots:
    void onTabBarClicked(int index);
    void onTabCloseRequested(int index);

private:
    void syncTab(DockPane* pane);
    void forgetDestroyedPane(DockPane* pane);

    QTabBar* m_tabBar = nullptr;
    QStackedWidget* m_stack = nullptr;
    QList<DockPane*> m_panes;
    QPointer<DockPane> m_selected;
    int m_relayoutCount = 0;
};
