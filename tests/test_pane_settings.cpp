/*
DockKit — PaneSettings / FocusScopeWidget tests
Role: Verify stored pane preferences and the focus scope memory
Testing Strategy: QSettings runs in QStandardPaths test mode; every test resets the "panes" group
Coverage: Defaults, rejected values, new panes picking up settings, scope membership
*/
#include <gtest/gtest.h>
#include "widgets/DockPane.hpp"
#include "widgets/FocusScopeWidget.hpp"
#include "widgets/PaneSettings.hpp"
#include <QAction>
#include <QLineEdit>
#include <QSettings>
#include <limits>
#include <memory>

class PaneSettingsTest : public ::testing::Test {
protected:
    void SetUp() override { PaneSettings::reset(); }
    void TearDown() override { PaneSettings::reset(); }
};

// =============================================================================
// Content Size
// =============================================================================

TEST_F(PaneSettingsTest, DefaultsWhenNothingStored) {
    EXPECT_DOUBLE_EQ(PaneSettings::defaultContentSize(), PaneSettings::DEFAULT_CONTENT_SIZE);
    EXPECT_EQ(PaneSettings::closeShortcut(), QKeySequence(QKeySequence::Close));
}

TEST_F(PaneSettingsTest, InvalidContentSizeIsNotStored) {
    EXPECT_FALSE(PaneSettings::setDefaultContentSize(0));
    EXPECT_FALSE(PaneSettings::setDefaultContentSize(-10));
    EXPECT_FALSE(PaneSettings::setDefaultContentSize(std::numeric_limits<double>::infinity()));

    EXPECT_DOUBLE_EQ(PaneSettings::defaultContentSize(), PaneSettings::DEFAULT_CONTENT_SIZE);
}

TEST_F(PaneSettingsTest, NewPanesUseStoredContentSize) {
    ASSERT_TRUE(PaneSettings::setDefaultContentSize(300));

    DockPane pane("Notes");
    EXPECT_DOUBLE_EQ(pane.contentSize(), 300.0);
}

TEST_F(PaneSettingsTest, CorruptStoredSizeFallsBack) {
    {
        QSettings settings;
        settings.setValue("panes/defaultContentSize", "wide");
    }
    EXPECT_DOUBLE_EQ(PaneSettings::defaultContentSize(), PaneSettings::DEFAULT_CONTENT_SIZE);
}

// =============================================================================
// Close Shortcut
// =============================================================================

TEST_F(PaneSettingsTest, NewPanesUseStoredCloseShortcut) {
    const QKeySequence shortcut("Ctrl+Shift+W");
    PaneSettings::setCloseShortcut(shortcut);

    EXPECT_EQ(PaneSettings::closeShortcut(), shortcut);
    DockPane pane("Output");
    EXPECT_EQ(pane.closeAction()->shortcut(), shortcut);
}

// =============================================================================
// FocusScopeWidget
// =============================================================================

TEST(FocusScopeWidget, RemembersOnlyDescendants) {
    FocusScopeWidget scope;
    auto* inside = new QLineEdit(&scope);
    QLineEdit outside;

    scope.setLastFocusedWidget(inside);
    scope.setLastFocusedWidget(&outside);

    EXPECT_EQ(scope.lastFocusedWidget(), inside);
}

TEST(FocusScopeWidget, ForgetsWidgetsThatLeaveOrDie) {
    FocusScopeWidget scope;
    auto* edit = new QLineEdit(&scope);
    scope.setLastFocusedWidget(edit);

    std::unique_ptr<QLineEdit> moved(edit);
    edit->setParent(nullptr);
    EXPECT_EQ(scope.lastFocusedWidget(), nullptr);

    moved.reset();
    EXPECT_EQ(scope.lastFocusedWidget(), nullptr);
}

TEST(FocusScopeWidget, ChangeSignalFiresOncePerWidget) {
    FocusScopeWidget scope;
    auto* edit = new QLineEdit(&scope);
    int changes = 0;
    QObject::connect(&scope, &FocusScopeWidget::lastFocusedWidgetChanged, [&changes](QWidget*) { ++changes; });

    scope.setLastFocusedWidget(edit);
    scope.setLastFocusedWidget(edit);
    scope.setLastFocusedWidget(nullptr);

    EXPECT_EQ(changes, 2);
}
