#include <gtest/gtest.h>

#include "testutils.h"
#include "theme/tabbartheme.h"
#include "theme/thememanager.h"
#include "ui/documenttabwidget.h"
#include "ui/styledebugger.h"

TEST(StyleDebuggerTest, DescribeListsRulesInCascadeOrder) {
    const QString report = StyleDebugger::describe(TabBarTheme::defaultTable(),
                                                   WidgetState::forTab(0, 3, 0, -1, false));

    EXPECT_TRUE(report.startsWith("State: QTabBar::tab:top:first:selected\n"));
    const int generic = report.indexOf("] QTabBar::tab\n");
    const int selected = report.indexOf("] QTabBar::tab:top:selected\n");
    ASSERT_GE(generic, 0);
    ASSERT_GE(selected, 0);
    EXPECT_LT(generic, selected);
    EXPECT_TRUE(report.contains(
        "  background: qlineargradient(x1: 0, y1: 0, x2: 0, y2: 1, stop: 0 #F8F8F8, stop: 1 #EDEDED);\n"));
    EXPECT_TRUE(report.contains("  margin-right: -1px;\n"));
}

TEST(StyleDebuggerTest, DescribeUnmatchedState) {
    const QString report = StyleDebugger::describe(StyleRuleTable(), WidgetState::forTabBar(false));

    EXPECT_TRUE(report.contains("No rule matches"));
    EXPECT_FALSE(report.contains("Resolved properties"));
}

TEST(StyleDebuggerTest, PickerStartsOnSelectedFirstTab) {
    ThemeManager::instance()->loadBuiltIn();
    StyleDebugger debugger;

    EXPECT_EQ(debugger.pickedState(),
              WidgetState(WidgetType::Tab, WidgetState::Top | WidgetState::First | WidgetState::Selected));
    EXPECT_TRUE(debugger.reportText().startsWith("State: QTabBar::tab:top:first:selected"));
    EXPECT_EQ(debugger.tabWidget()->count(), 5);
}
