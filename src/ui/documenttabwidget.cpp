#include "ui/documenttabwidget.h"
#include "theme/thememanager.h"

#include <QApplication>
#include <QCursor>
#include <QDebug>
#include <QHoverEvent>
#include <QMouseEvent>
#include <QStyle>
#include <QTabBar>

DocumentTabWidget::DocumentTabWidget(QWidget *parent)
    : QTabWidget(parent)
{
    setObjectName("documentTabs");
    setTabsClosable(true);
    setMovable(true);
    setDocumentMode(true); // no frame around the pages, only the tab bar is themed

    QTabBar *bar = tabBar();
    bar->setUsesScrollButtons(true);
    bar->setElideMode(Qt::ElideRight);
    bar->setExpanding(false);
    bar->setAttribute(Qt::WA_Hover, true);
    bar->setMouseTracking(true);
    bar->installEventFilter(this);

    connect(this, &QTabWidget::tabCloseRequested, this, &DocumentTabWidget::onTabCloseRequested);
    connect(ThemeManager::instance(), &ThemeManager::themeChanged, this, &DocumentTabWidget::onThemeChanged);
}

int DocumentTabWidget::addDocument(QWidget *page, const QString &title)
{
    const int index = addTab(page, title);
    setTabToolTip(index, title);
    return index;
}

void DocumentTabWidget::setTabsAtBottom(bool bottom)
{
    setTabPosition(bottom ? QTabWidget::South : QTabWidget::North);
}

bool DocumentTabWidget::tabsAtBottom() const
{
    return tabPosition() == QTabWidget::South;
}

WidgetState DocumentTabWidget::tabState(int index) const
{
    const QTabBar *bar = tabBar();
    const bool focused = bar->hasFocus();
    return WidgetState::forTab(index, count(), currentIndex(), m_hoveredIndex, tabsAtBottom(), focused);
}

WidgetState DocumentTabWidget::closeButtonState(int index) const
{
    bool hovered = false;
    const QWidget *button = tabBar()->tabButton(index, QTabBar::RightSide);
    if (button && button->isVisible()) {
        hovered = button->rect().contains(button->mapFromGlobal(QCursor::pos()));
    }
    return WidgetState::forCloseButton(tabsAtBottom(), hovered);
}

WidgetState DocumentTabWidget::tabBarState() const
{
    return WidgetState::forTabBar(tabsAtBottom());
}

PropertySet DocumentTabWidget::resolvedTabStyle(int index) const
{
    return ThemeManager::instance()->resolve(tabState(index));
}

PropertySet DocumentTabWidget::resolvedCloseButtonStyle(int index) const
{
    return ThemeManager::instance()->resolve(closeButtonState(index));
}

void DocumentTabWidget::setHoveredIndex(int index)
{
    if (index == m_hoveredIndex) return;
    m_hoveredIndex = index;
    emit hoveredTabChanged(index);
}

bool DocumentTabWidget::eventFilter(QObject *obj, QEvent *event)
{
    if (obj == tabBar()) {
        QTabBar *bar = tabBar();
        switch (event->type()) {
            case QEvent::MouseMove:
                setHoveredIndex(bar->tabAt(static_cast<QMouseEvent*>(event)->position().toPoint()));
                break;
            case QEvent::HoverMove:
            case QEvent::HoverEnter:
                setHoveredIndex(bar->tabAt(static_cast<QHoverEvent*>(event)->position().toPoint()));
                break;
            case QEvent::Leave:
            case QEvent::HoverLeave:
                setHoveredIndex(-1);
                break;
            default:
                break;
        }
    }
    return QTabWidget::eventFilter(obj, event);
}

void DocumentTabWidget::onTabCloseRequested(int index)
{
    QWidget *page = widget(index);
    removeTab(index);
    if (page) page->deleteLater();
    // The tab under the cursor changed
    setHoveredIndex(-1);
}

void DocumentTabWidget::onThemeChanged()
{
    forceStyleRefresh();
}

void DocumentTabWidget::forceStyleRefresh()
{
    QTabBar *bar = tabBar();
    bar->style()->unpolish(bar);
    bar->style()->polish(bar);
    bar->update();
    qDebug() << "DocumentTabWidget: Forced style refresh (unpolish + polish)";
}

void DocumentTabWidget::debugStyleConflicts() const
{
    qDebug() << "=== DOCUMENTTABWIDGET STYLE DEBUGGING ===";
    qDebug() << "Application style:" << QApplication::style()->objectName();
    const QString globalSheet = qApp->styleSheet();
    if (globalSheet.isEmpty()) {
        qDebug() << "Global stylesheet: NONE";
    } else {
        qDebug() << "Global stylesheet:" << globalSheet.length() << "characters";
    }

    // Widget level sheets override the application one for this subtree
    const QWidget *parent = this;
    int level = 0;
    while (parent && level < 5) {
        if (!parent->styleSheet().isEmpty()) {
            qWarning() << "DocumentTabWidget: Level" << level << parent->metaObject()->className()
                       << "sets its own stylesheet," << parent->styleSheet().length() << "characters";
        }
        parent = parent->parentWidget();
        ++level;
    }
    if (!tabBar()->styleSheet().isEmpty()) {
        qWarning() << "DocumentTabWidget: Tab bar sets its own stylesheet";
    }

    ThemeManager *theme = ThemeManager::instance();
    qDebug() << "Theme source:" << (theme->isBuiltIn() ? QStringLiteral("<built-in>") : theme->sourcePath())
             << "-" << theme->table().size() << "rules";
    for (int i = 0; i < count(); ++i) {
        qDebug().noquote() << "Tab" << i << tabState(i).toString();
    }
    qDebug() << "=== END STYLE DEBUG ===";
}
