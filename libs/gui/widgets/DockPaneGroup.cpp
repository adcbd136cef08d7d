#include "DockPaneGroup.hpp"
#include "DockPane.hpp"
#include "DockKitLogging.hpp"
#include <QAction>
#include <QLayout>
#include <QSignalBlocker>
#include <QStackedWidget>
#include <QStyle>
#include <QTabBar>
#include <QVBoxLayout>
#include <utility>

DockPaneGroup::DockPaneGroup(QWidget* parent)
    : QWidget(parent)
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_tabBar = new QTabBar(this);
    m_tabBar->setDocumentMode(true);
    m_tabBar->setTabsClosable(true);
    m_tabBar->setExpanding(false);
    m_tabBar->setFocusPolicy(Qt::NoFocus);
    layout->addWidget(m_tabBar);

    m_stack = new QStackedWidget(this);
    layout->addWidget(m_stack, 1);

    connect(m_tabBar, &QTabBar::tabBarClicked, this, &DockPaneGroup::onTabBarClicked);
    connect(m_tabBar, &QTabBar::tabCloseRequested, this, &DockPaneGroup::onTabCloseRequested);

    // Keyboard and wheel navigation on the strip
    connect(m_tabBar, &QTabBar::currentChanged, this, [this](int index) {
        if (index < 0 || index >= m_panes.size()) return;
        DockPane* pane = m_panes.at(index);
        if (pane != m_selected) {
            setSelectedPane(pane);
            requestRelayout();
        }
    });
}

DockPaneGroup::~DockPaneGroup() {
    // Member panes die with m_stack after this body; their destroyed signal must not reach us
    for (DockPane* pane : std::as_const(m_panes)) {
        disconnect(pane, nullptr, this, nullptr);
    }
}

void DockPaneGroup::addPane(DockPane* pane) {
    if (!pane || m_panes.contains(pane)) return;

    m_panes.append(pane);
    m_stack->addWidget(pane);
    {
        QSignalBlocker blocker(m_tabBar);
        m_tabBar->addTab(pane->tabLabel());
    }
    syncTab(pane);

    connect(pane, &DockPane::tabLabelChanged, this, [this, pane]() { syncTab(pane); });
    connect(pane, &DockPane::titleChanged, this, [this, pane]() { syncTab(pane); });
    connect(pane, &DockPane::allowCloseChanged, this, [this, pane]() { syncTab(pane); });
    // Panes deleted without going through closePane()
    connect(pane, &QObject::destroyed, this, [this, pane]() { forgetDestroyedPane(pane); });

    if (!m_selected) {
        setSelectedPane(pane);
    }

    dkLog_Pane("Group" << this << "added pane" << pane->title() << "- members:" << m_panes.size());
}

void DockPaneGroup::removeMember(DockPane* pane) {
    const int index = m_panes.indexOf(pane);
    if (index < 0) {
        dkLog_Warning("DockPaneGroup::removeMember: pane is not a member" << pane);
        return;
    }

    disconnect(pane, nullptr, this, nullptr);
    const bool wasSelected = (m_selected == pane);

    m_panes.removeAt(index);
    {
        QSignalBlocker blocker(m_tabBar);
        m_tabBar->removeTab(index);
    }
    m_stack->removeWidget(pane);
    pane->setSelected(false);
    pane->setParent(nullptr);

    if (wasSelected) {
        m_selected = nullptr;
        if (!m_panes.isEmpty()) {
            setSelectedPane(m_panes.at(qMin(index, int(m_panes.size()) - 1)));
            requestRelayout();
        } else {
            emit selectedPaneChanged(nullptr);
        }
    }

    dkLog_Pane("Group" << this << "removed pane" << pane->title() << "- members:" << m_panes.size());
}

void DockPaneGroup::forgetDestroyedPane(DockPane* pane) {
    // Only bookkeeping here: the pane object is already half destroyed
    const int index = m_panes.indexOf(pane);
    if (index < 0) return;

    m_panes.removeAt(index);
    {
        QSignalBlocker blocker(m_tabBar);
        m_tabBar->removeTab(index);
    }
    if (!m_selected && !m_panes.isEmpty()) {
        setSelectedPane(m_panes.at(qMin(index, int(m_panes.size()) - 1)));
        requestRelayout();
    }
    dkLog_Pane("Group" << this << "dropped destroyed pane - members:" << m_panes.size());
}

void DockPaneGroup::removeSelf() {
    dkLog_Pane("Group" << this << "removing itself from" << parentWidget());

    if (QWidget* parent = parentWidget()) {
        if (QLayout* parentLayout = parent->layout()) {
            parentLayout->removeWidget(this);
        }
    }
    setParent(nullptr);
    emit removedFromParent(this);

    if (testAttribute(Qt::WA_DeleteOnClose)) {
        deleteLater();
    }
}

void DockPaneGroup::setSelectedPane(DockPane* pane) {
    if (pane && !m_panes.contains(pane)) {
        dkLog_Warning("DockPaneGroup::setSelectedPane: pane is not a member" << pane);
        return;
    }
    if (m_selected == pane) return;

    DockPane* previous = m_selected.data();
    m_selected = pane;
    if (previous) {
        previous->setSelected(false);
    }
    if (pane) {
        pane->setSelected(true);
        QSignalBlocker blocker(m_tabBar);
        m_tabBar->setCurrentIndex(m_panes.indexOf(pane));
    }
    emit selectedPaneChanged(pane);
}

void DockPaneGroup::requestRelayout() {
    ++m_relayoutCount;
    if (m_selected) {
        m_stack->setCurrentWidget(m_selected);
    }
    if (QLayout* l = layout()) {
        l->activate();
    }
    updateGeometry();
}

void DockPaneGroup::syncTab(DockPane* pane) {
    const int index = m_panes.indexOf(pane);
    if (index < 0) return;

    m_tabBar->setTabText(index, pane->tabLabel());
    m_tabBar->setTabToolTip(index, pane->title());

    const auto side = static_cast<QTabBar::ButtonPosition>(
        m_tabBar->style()->styleHint(QStyle::SH_TabBar_CloseButtonPosition, nullptr, m_tabBar));
    if (QWidget* closeButton = m_tabBar->tabButton(index, side)) {
        closeButton->setEnabled(pane->allowClose());
    }
}

void DockPaneGroup::onTabBarClicked(int index) {
    if (index < 0 || index >= m_panes.size()) return;
    m_panes.at(index)->selectAndActivate();
}

void DockPaneGroup::onTabCloseRequested(int index) {
    if (index < 0 || index >= m_panes.size()) return;
    // Disabled while allowClose is false
    m_panes.at(index)->closeAction()->trigger();
}
