#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>

class DocumentTabWidget;

// Editor shell: the themed document tab area plus the menus that drive it
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(QWidget *parent = nullptr);

    DocumentTabWidget *documentTabs() const { return m_documentTabs; }

public slots:
    int newDiagram();
    void setTabsAtBottom(bool bottom);
    void reloadTheme();

private:
    void setupMenus();

    DocumentTabWidget *m_documentTabs;
    int m_untitledCounter = 0;
};

#endif // MAINWINDOW_H
