#include "WorkspaceWindow.hpp"
#include "widgets/DockPane.hpp"
#include "widgets/DockPaneGroup.hpp"
#include "widgets/FocusScopeWidget.hpp"
#include "DockKitLogging.hpp"
#include <QAction>
#include <QApplication>
#include <QFormLayout>
#include <QLineEdit>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QScopeGuard>
#include <QSplitter>
#include <QStatusBar>
#include <QVBoxLayout>

// Helper macro for scoped logging
#define LOG_SCOPE(msg) dkLog_App(msg " started"); auto _scopeGuard = qScopeGuard([=]{ dkLog_App(msg " complete"); });

WorkspaceWindow::WorkspaceWindow(const ManifestParseResult& manifest, QWidget* parent)
    : QMainWindow(parent)
{
    LOG_SCOPE("WorkspaceWindow construction");

    setupUI(manifest);
    setupMenuBar();

    setWindowTitle("DockKit Workspace");
    resize(1100, 700);

    if (!manifest.ok()) {
        statusBar()->showMessage(tr("Workspace loaded with %1 problem(s), see log").arg(manifest.errors.size()));
    }
}

void WorkspaceWindow::setupUI(const ManifestParseResult& manifest) {
    LOG_SCOPE("Setting up workspace");

    m_splitter = new QSplitter(Qt::Horizontal, this);
    m_splitter->setChildrenCollapsible(false);
    setCentralWidget(m_splitter);

    for (const auto& groupDescription : manifest.groups) {
        m_splitter->addWidget(buildGroup(groupDescription));
    }
    applyContentSizes();

    dkLog_App("Workspace has" << groups().size() << "groups and" << panes().size() << "panes");
}

void WorkspaceWindow::setupMenuBar() {
    QMenu* paneMenu = menuBar()->addMenu("&Pane");

    QAction* closeAction = paneMenu->addAction("&Close Current Pane");
    connect(closeAction, &QAction::triggered, this, &WorkspaceWindow::closeCurrentPane);

    QAction* nextAction = paneMenu->addAction("&Next Pane");
    nextAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Tab));
    connect(nextAction, &QAction::triggered, this, &WorkspaceWindow::activateNextPane);

    paneMenu->addSeparator();
    QAction* quitAction = paneMenu->addAction("&Quit");
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);

    // Enable state follows the pane that would be closed
    connect(paneMenu, &QMenu::aboutToShow, this, [this, closeAction]() {
        DockPane* pane = currentPane();
        closeAction->setEnabled(pane && pane->closeAction()->isEnabled());
    });
}

DockPaneGroup* WorkspaceWindow::buildGroup(const GroupDescription& description) {
    auto* group = new DockPaneGroup(m_splitter);
    group->setAttribute(Qt::WA_DeleteOnClose);

    for (const auto& paneDescription : description.panes) {
        group->addPane(buildPane(paneDescription));
    }

    connect(group, &DockPaneGroup::removedFromParent, this, [this](DockPaneGroup*) {
        dkLog_App("Group collapsed, remaining groups:" << groups().size());
        if (groups().isEmpty()) {
            statusBar()->showMessage(tr("All panes closed"));
        }
    });
    return group;
}

DockPane* WorkspaceWindow::buildPane(const PaneDescription& description) {
    auto* pane = new DockPane(QString::fromStdString(description.title));
    pane->setAttribute(Qt::WA_DeleteOnClose);
    pane->setTabLabel(QString::fromStdString(description.tabLabel));
    if (description.contentSize) {
        pane->setContentSize(*description.contentSize);
    }
    pane->setAllowClose(description.allowClose);
    pane->setContent(buildContent(description));

    // Edited forms ask before going away
    connect(pane, &DockPane::closing, this, [this](DockPane* closingPane, bool* cancel) {
        const QWidget* content = closingPane->content();
        if (!content) return;
        bool edited = false;
        for (const QLineEdit* edit : content->findChildren<QLineEdit*>()) {
            edited = edited || edit->isModified();
        }
        if (!edited) return;

        const auto answer = QMessageBox::question(this, tr("Close %1").arg(closingPane->title()),
                                                  tr("Discard the edits in %1?").arg(closingPane->title()));
        *cancel = (answer != QMessageBox::Yes);
    }, Qt::DirectConnection);

    return pane;
}

QWidget* WorkspaceWindow::buildContent(const PaneDescription& description) {
    auto* scope = new FocusScopeWidget();

    if (description.fields.empty()) {
        auto* layout = new QVBoxLayout(scope);
        auto* log = new QPlainTextEdit(scope);
        log->setReadOnly(true);
        log->setPlaceholderText(tr("%1 is empty").arg(QString::fromStdString(description.title)));
        layout->addWidget(log);
        return scope;
    }

    auto* form = new QFormLayout(scope);
    for (const auto& field : description.fields) {
        form->addRow(QString::fromStdString(field), new QLineEdit(scope));
    }
    return scope;
}

void WorkspaceWindow::applyContentSizes() {
    QList<int> sizes;
    for (DockPaneGroup* group : groups()) {
        DockPane* selected = group->selectedPane();
        sizes.append(selected ? static_cast<int>(selected->contentSize()) : 0);
    }
    m_splitter->setSizes(sizes);
}

QList<DockPaneGroup*> WorkspaceWindow::groups() const {
    QList<DockPaneGroup*> result;
    for (int i = 0; i < m_splitter->count(); ++i) {
        if (auto* group = qobject_cast<DockPaneGroup*>(m_splitter->widget(i))) {
            result.append(group);
        }
    }
    return result;
}

QList<DockPane*> WorkspaceWindow::panes() const {
    QList<DockPane*> result;
    for (DockPaneGroup* group : groups()) {
        result.append(group->panes());
    }
    return result;
}

DockPane* WorkspaceWindow::currentPane() const {
    for (QWidget* w = QApplication::focusWidget(); w; w = w->parentWidget()) {
        if (auto* pane = qobject_cast<DockPane*>(w)) {
            return pane;
        }
    }
    const auto allGroups = groups();
    return allGroups.isEmpty() ? nullptr : allGroups.first()->selectedPane();
}

void WorkspaceWindow::closeCurrentPane() {
    if (DockPane* pane = currentPane()) {
        pane->closeAction()->trigger();
    }
}

void WorkspaceWindow::activateNextPane() {
    const auto all = panes();
    if (all.isEmpty()) return;

    const int current = all.indexOf(currentPane());
    DockPane* next = all.at((current + 1) % all.size());
    next->selectAndActivate();
}

void WorkspaceWindow::onPaneClosed(DockPane* pane) {
    dkLog_App("Pane closed:" << pane->title());
    statusBar()->showMessage(tr("Closed %1").arg(pane->title()), 4000);
}
