/*
DockKit — DockPaneGroup tests
Role: Verify the tabbed container against real panes
Testing Strategy: Build groups inside a host widget → drive panes and the tab bar → assert
                  membership, selection, tabs and collapse
Coverage: Add/select/remove, tab text sync, close buttons, cascading collapse, deleted panes
*/
#include <gtest/gtest.h>
#include "widgets/DockPane.hpp"
#include "widgets/DockPaneGroup.hpp"
#include "fixtures/spy_container.hpp"
#include <QCoreApplication>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QPointer>
#include <QTabBar>
#include <memory>

class DockPaneGroupTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* layout = new QHBoxLayout(&host);
        group = new DockPaneGroup(&host);
        layout->addWidget(group);

        explorer = new DockPane("Explorer");
        search = new DockPane("Search");
        group->addPane(explorer);
        group->addPane(search);
    }

    QWidget host;
    QPointer<DockPaneGroup> group;
    QPointer<DockPane> explorer;
    QPointer<DockPane> search;
};

// =============================================================================
// Membership & Selection
// =============================================================================

TEST_F(DockPaneGroupTest, FirstPaneIsSelected) {
    EXPECT_EQ(group->memberCount(), 2);
    EXPECT_EQ(group->selectedPane(), explorer.data());
    EXPECT_TRUE(explorer->isSelected());
    EXPECT_FALSE(search->isSelected());
    EXPECT_EQ(group->tabBar()->count(), 2);
    EXPECT_EQ(group->tabBar()->currentIndex(), 0);
}

TEST_F(DockPaneGroupTest, PanesFindTheGroupAsContainer) {
    EXPECT_EQ(explorer->findParentContainer(), static_cast<IDockPaneContainer*>(group.data()));
    EXPECT_EQ(search->findParentContainer(), static_cast<IDockPaneContainer*>(group.data()));
}

TEST_F(DockPaneGroupTest, AddingTwiceIsIgnored) {
    group->addPane(explorer);
    EXPECT_EQ(group->memberCount(), 2);
}

TEST_F(DockPaneGroupTest, SelectingMovesFlagAndTab) {
    group->setSelectedPane(search);

    EXPECT_EQ(group->selectedPane(), search.data());
    EXPECT_TRUE(search->isSelected());
    EXPECT_FALSE(explorer->isSelected());
    EXPECT_EQ(group->tabBar()->currentIndex(), 1);
}

TEST_F(DockPaneGroupTest, SelectingForeignPaneIsIgnored) {
    DockPane stranger("Stranger");
    group->setSelectedPane(&stranger);

    EXPECT_EQ(group->selectedPane(), explorer.data());
    EXPECT_FALSE(stranger.isSelected());
}

TEST_F(DockPaneGroupTest, SelectAndActivateRaisesAndFocusesPane) {
    auto* edit = new QLineEdit();
    search->setContent(edit);
    ASSERT_TRUE(search->isHidden());

    search->selectAndActivate();

    EXPECT_EQ(group->selectedPane(), search.data());
    EXPECT_EQ(group->relayoutCount(), 1);
    EXPECT_FALSE(search->isHidden());
    EXPECT_EQ(host.focusWidget(), edit);
}

TEST_F(DockPaneGroupTest, SelectAndActivateOnSelectedPaneSkipsRelayout) {
    explorer->selectAndActivate();
    EXPECT_EQ(group->relayoutCount(), 0);
}

TEST_F(DockPaneGroupTest, ClickingTabSelectsPane) {
    emit group->tabBar()->tabBarClicked(1);

    EXPECT_EQ(group->selectedPane(), search.data());
    EXPECT_EQ(group->tabBar()->currentIndex(), 1);
}

// =============================================================================
// Tab Strip
// =============================================================================

TEST_F(DockPaneGroupTest, TabTextFollowsTabLabel) {
    EXPECT_EQ(group->tabBar()->tabText(0), "Explorer");

    explorer->setTitle("Files");
    EXPECT_EQ(group->tabBar()->tabText(0), "Files");

    explorer->setTabLabel("F");
    explorer->setTitle("Project");
    EXPECT_EQ(group->tabBar()->tabText(0), "F");
    EXPECT_EQ(group->tabBar()->tabToolTip(0), "Project");
}

TEST_F(DockPaneGroupTest, TabCloseRespectsAllowClose) {
    explorer->setAllowClose(false);

    emit group->tabBar()->tabCloseRequested(0);

    EXPECT_EQ(group->memberCount(), 2);
    EXPECT_FALSE(explorer->isClosed());
}

TEST_F(DockPaneGroupTest, TabCloseClosesPane) {
    emit group->tabBar()->tabCloseRequested(1);
    std::unique_ptr<DockPane> closed(search.data());

    EXPECT_TRUE(closed->isClosed());
    EXPECT_EQ(group->memberCount(), 1);
    EXPECT_EQ(group->tabBar()->count(), 1);
}

// =============================================================================
// Removal & Collapse
// =============================================================================

TEST_F(DockPaneGroupTest, ClosingSelectedPaneSelectsNeighbour) {
    ASSERT_TRUE(explorer->closePane());
    std::unique_ptr<DockPane> closed(explorer.data());

    EXPECT_EQ(group->memberCount(), 1);
    EXPECT_EQ(group->selectedPane(), search.data());
    EXPECT_TRUE(search->isSelected());
    EXPECT_FALSE(closed->isSelected());
    EXPECT_EQ(closed->parentWidget(), nullptr);
    EXPECT_EQ(group->tabBar()->tabText(0), "Search");
}

TEST_F(DockPaneGroupTest, ClosingUnselectedPaneKeepsSelection) {
    ASSERT_TRUE(search->closePane());
    std::unique_ptr<DockPane> closed(search.data());

    EXPECT_EQ(group->selectedPane(), explorer.data());
    EXPECT_EQ(group->parentWidget(), &host);
}

TEST_F(DockPaneGroupTest, ClosingLastPaneCollapsesGroup) {
    int collapses = 0;
    QObject::connect(group, &DockPaneGroup::removedFromParent, [&collapses](DockPaneGroup*) { ++collapses; });

    ASSERT_TRUE(explorer->closePane());
    std::unique_ptr<DockPane> first(explorer.data());
    EXPECT_EQ(collapses, 0);

    ASSERT_TRUE(search->closePane());
    std::unique_ptr<DockPane> second(search.data());

    EXPECT_EQ(collapses, 1);
    EXPECT_EQ(group->memberCount(), 0);
    EXPECT_EQ(group->selectedPane(), nullptr);
    EXPECT_EQ(group->parentWidget(), nullptr);
    EXPECT_EQ(host.layout()->count(), 0);

    std::unique_ptr<DockPaneGroup> detached(group.data());
}

TEST_F(DockPaneGroupTest, CollapsedGroupWithDeleteOnCloseGoesAway) {
    group->setAttribute(Qt::WA_DeleteOnClose);
    explorer->setAttribute(Qt::WA_DeleteOnClose);
    search->setAttribute(Qt::WA_DeleteOnClose);

    ASSERT_TRUE(explorer->closePane());
    ASSERT_TRUE(search->closePane());
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);

    EXPECT_TRUE(group.isNull());
    EXPECT_TRUE(explorer.isNull());
    EXPECT_TRUE(search.isNull());
}

TEST_F(DockPaneGroupTest, DeletedPaneIsForgotten) {
    delete explorer.data();

    EXPECT_EQ(group->memberCount(), 1);
    EXPECT_EQ(group->tabBar()->count(), 1);
    EXPECT_EQ(group->selectedPane(), search.data());
}

TEST_F(DockPaneGroupTest, DeletingGroupWithMembersDeletesThemQuietly) {
    int selectionChanges = 0;
    QObject::connect(group, &DockPaneGroup::selectedPaneChanged, [&selectionChanges](DockPane*) { ++selectionChanges; });

    delete group.data();

    EXPECT_TRUE(group.isNull());
    EXPECT_TRUE(explorer.isNull());
    EXPECT_TRUE(search.isNull());
    EXPECT_EQ(selectionChanges, 0);
}

TEST(DockPaneGroup, HostTeardownWithSelectedContentPanes) {
    auto host = std::make_unique<QWidget>();
    auto* layout = new QHBoxLayout(host.get());
    auto* group = new DockPaneGroup(host.get());
    layout->addWidget(group);
    for (const char* title : {"Explorer", "Search", "Output"}) {
        auto* pane = new DockPane(title);
        pane->setContent(new QLineEdit());
        group->addPane(pane);
    }
    group->panes().at(1)->selectAndActivate();
    QPointer<DockPane> watched = group->panes().at(2);

    host.reset();

    EXPECT_TRUE(watched.isNull());
}

TEST_F(DockPaneGroupTest, ClosedListenerAboveGroupIsNotified) {
    ClosedListenerHost listenerHost;
    group->setParent(&listenerHost);

    ASSERT_TRUE(search->closePane());
    std::unique_ptr<DockPane> closed(search.data());

    ASSERT_EQ(listenerHost.closedPanes().size(), 1);
    EXPECT_EQ(listenerHost.closedPanes().first(), closed.get());

    group->setParent(nullptr);
    std::unique_ptr<DockPaneGroup> detached(group.data());
}
