/*
DockKit — main.cpp
Role: Entry point for the DockKit demo workspace.
Usage: dockkit_demo [manifest.json]
*/
#include "WorkspaceWindow.hpp"
#include "PaneManifest.hpp"
#include "DockKitLogging.hpp"
#include <QApplication>
#include <QCommandLineParser>

// --- Workspace description: file from the command line, built-in otherwise ---
ManifestParseResult loadWorkspace(const QStringList& positional) {
    if (positional.isEmpty()) {
        dkLog_App("No manifest given, using the built-in workspace");
        return PaneManifest::parse(PaneManifest::defaultWorkspace());
    }

    ManifestParseResult manifest = PaneManifest::loadFile(positional.first().toStdString());
    if (manifest.groups.empty()) {
        dkLog_Error("Manifest" << positional.first() << "has no usable groups - falling back to the built-in workspace");
        ManifestParseResult fallback = PaneManifest::parse(PaneManifest::defaultWorkspace());
        fallback.errors.insert(fallback.errors.begin(), manifest.errors.begin(), manifest.errors.end());
        return fallback;
    }
    return manifest;
}

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName("DockKit");
    QCoreApplication::setApplicationName("dockkit_demo");

    QCommandLineParser parser;
    parser.setApplicationDescription("DockKit pane workspace demo");
    parser.addHelpOption();
    parser.addPositionalArgument("manifest", "Workspace description (JSON)", "[manifest.json]");
    parser.process(app);

    dkLog_App("[DockKit demo starting]");

    WorkspaceWindow window(loadWorkspace(parser.positionalArguments()));
    window.show();

    return app.exec();
}
