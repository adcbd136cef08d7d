/*
DockKit — test runner
Role: Boot a QApplication on the offscreen platform before running GoogleTest.
Settings are redirected to Qt's test location and cleared so defaults apply.
*/
#include <gtest/gtest.h>
#include <QApplication>
#include <QStandardPaths>
#include "widgets/PaneSettings.hpp"

int main(int argc, char** argv) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QStandardPaths::setTestModeEnabled(true);

    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName("DockKitTests");
    QCoreApplication::setApplicationName("dockkit_tests");
    PaneSettings::reset();

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
