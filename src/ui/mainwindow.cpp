#include "ui/mainwindow.h"
#include "ui/documenttabwidget.h"
#include "core/appconfig.h"
#include "theme/thememanager.h"

#include <QAction>
#include <QApplication>
#include <QKeySequence>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QStatusBar>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_documentTabs(new DocumentTabWidget(this))
{
    setWindowTitle("Graphol Editor");
    resize(1024, 720);
    setCentralWidget(m_documentTabs);

    m_documentTabs->setTabsAtBottom(AppConfig::getInstance().areTabsAtBottom());
    setupMenus();

    newDiagram();
}

void MainWindow::setupMenus()
{
    QMenu *fileMenu = menuBar()->addMenu("&File");
    QAction *newAction = fileMenu->addAction("&New Diagram");
    newAction->setShortcut(QKeySequence::New);
    connect(newAction, &QAction::triggered, this, &MainWindow::newDiagram);

    QAction *closeAction = fileMenu->addAction("&Close Diagram");
    closeAction->setShortcut(QKeySequence::Close);
    connect(closeAction, &QAction::triggered, this, [this]() {
        const int index = m_documentTabs->currentIndex();
        if (index >= 0) emit m_documentTabs->tabCloseRequested(index);
    });

    fileMenu->addSeparator();
    QAction *exitAction = fileMenu->addAction("E&xit");
    exitAction->setShortcut(QKeySequence::Quit);
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    QMenu *viewMenu = menuBar()->addMenu("&View");
    QAction *bottomAction = viewMenu->addAction("Tabs at &Bottom");
    bottomAction->setCheckable(true);
    bottomAction->setChecked(m_documentTabs->tabsAtBottom());
    connect(bottomAction, &QAction::toggled, this, &MainWindow::setTabsAtBottom);

    QAction *reloadAction = viewMenu->addAction("&Reload Theme");
    reloadAction->setShortcut(QKeySequence::Refresh);
    connect(reloadAction, &QAction::triggered, this, &MainWindow::reloadTheme);
}

int MainWindow::newDiagram()
{
    const QString title = QString("Untitled %1").arg(++m_untitledCounter);
    QLabel *page = new QLabel(title);
    page->setAlignment(Qt::AlignCenter);
    const int index = m_documentTabs->addDocument(page, title);
    m_documentTabs->setCurrentIndex(index);
    return index;
}

void MainWindow::setTabsAtBottom(bool bottom)
{
    m_documentTabs->setTabsAtBottom(bottom);
    AppConfig &config = AppConfig::getInstance();
    config.setTabsAtBottom(bottom);
    config.sync();
}

void MainWindow::reloadTheme()
{
    ThemeManager *theme = ThemeManager::instance();
    const bool configured = theme->loadConfigured();
    theme->apply(qApp);

    if (!configured) {
        statusBar()->showMessage("Configured theme unavailable, using the built-in theme", 5000);
        return;
    }
    const int problems = theme->parseWarnings().size() + theme->issues().size();
    if (problems > 0) {
        statusBar()->showMessage(QString("Theme reloaded with %1 problem(s), see the log").arg(problems), 5000);
    } else {
        statusBar()->showMessage("Theme reloaded", 3000);
    }
}
