#ifndef DOCUMENTTABWIDGET_H
#define DOCUMENTTABWIDGET_H

#include "theme/styleruletable.h"

#include <QTabWidget>

class QTabBar;

// Tab widget of the editor's document area. The look comes entirely from the
// application style sheet (ThemeManager); this class keeps the tab bar set up
// the way the theme expects and reports each tab's state flags.
class DocumentTabWidget : public QTabWidget
{
    Q_OBJECT

public:
    explicit DocumentTabWidget(QWidget *parent = nullptr);

    int addDocument(QWidget *page, const QString &title);

    void setTabsAtBottom(bool bottom);
    bool tabsAtBottom() const;

    // State flags of one tab as the style engine sees them
    WidgetState tabState(int index) const;
    WidgetState closeButtonState(int index) const;
    WidgetState tabBarState() const;

    // Properties the current theme resolves for a tab / its close button
    PropertySet resolvedTabStyle(int index) const;
    PropertySet resolvedCloseButtonStyle(int index) const;

    int hoveredIndex() const { return m_hoveredIndex; }

    // Debug helpers for style sheet conflicts
    void debugStyleConflicts() const;
    void forceStyleRefresh();

signals:
    void hoveredTabChanged(int index);

protected:
    bool eventFilter(QObject *obj, QEvent *event) override;

private slots:
    void onTabCloseRequested(int index);
    void onThemeChanged();

private:
    void setHoveredIndex(int index);

    int m_hoveredIndex = -1;
};

#endif // DOCUMENTTABWIDGET_H
