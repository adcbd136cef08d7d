/*
DockKit — WorkspaceWindow
Role: Main window hosting groups of DockPanes side by side in a splitter.
Inputs/Outputs: Built from a ManifestParseResult; reports pane closes in the status bar.
Threading: GUI thread only.
Integration: Instantiated by apps/dockkit_demo/main.cpp.
Observability: Lifecycle via dkLog_App, pane traffic via the dockkit.pane category.
*/
#pragma once

#include "PaneManifest.hpp"
#include "widgets/IPaneClosedListener.hpp"
#include <QMainWindow>

class DockPane;
class DockPaneGroup;
class QSplitter;

class WorkspaceWindow : public QMainWindow, public IPaneClosedListener {
    Q_OBJECT

public:
    explicit WorkspaceWindow(const ManifestParseResult& manifest, QWidget* parent = nullptr);
    ~WorkspaceWindow() override = default;

    QList<DockPaneGroup*> groups() const;
    QList<DockPane*> panes() const;

    /**
     * Pane holding keyboard focus, else the selected pane of the first group.
     */
    DockPane* currentPane() const;

    // IPaneClosedListener
    void onPaneClosed(DockPane* pane) override;

private slots:
    void closeCurrentPane();
    void activateNextPane();

private:
    void setupUI(const ManifestParseResult& manifest);
    void setupMenuBar();
    DockPaneGroup* buildGroup(const GroupDescription& description);
    DockPane* buildPane(const PaneDescription& description);
    QWidget* buildContent(const PaneDescription& description);
    void applyContentSizes();

    QSplitter* m_splitter = nullptr;
};
