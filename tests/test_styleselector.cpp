#include <gtest/gtest.h>

#include "testutils.h"
#include "theme/styleselector.h"

namespace {

StyleSelector parsed(const QString &text)
{
    StyleSelector selector;
    QString error;
    EXPECT_TRUE(StyleSelector::parse(text, &selector, &error)) << error.toStdString();
    return selector;
}

QString parseError(const QString &text)
{
    StyleSelector selector;
    QString error;
    EXPECT_FALSE(StyleSelector::parse(text, &selector, &error)) << text.toStdString();
    return error;
}

} // namespace

TEST(WidgetStateTest, TabPositionFollowsTabBar) {
    const WidgetState only = WidgetState::forTab(0, 1, 0, -1, false);
    EXPECT_TRUE(only.testFlag(WidgetState::OnlyOne));
    EXPECT_FALSE(only.testFlag(WidgetState::First));
    EXPECT_FALSE(only.testFlag(WidgetState::Last));

    EXPECT_TRUE(WidgetState::forTab(0, 3, 0, -1, false).testFlag(WidgetState::First));
    EXPECT_TRUE(WidgetState::forTab(1, 3, 0, -1, false).testFlag(WidgetState::Middle));
    EXPECT_TRUE(WidgetState::forTab(2, 3, 0, -1, false).testFlag(WidgetState::Last));
    EXPECT_FALSE(WidgetState::forTab(2, 3, 0, -1, false).testFlag(WidgetState::Middle));
}

TEST(WidgetStateTest, SelectionHoverAndFocus) {
    const WidgetState current = WidgetState::forTab(1, 3, 1, 1, true, true);
    EXPECT_EQ(current, WidgetState(WidgetType::Tab,
                                   WidgetState::Bottom | WidgetState::Middle | WidgetState::Selected
                                   | WidgetState::Hover | WidgetState::Focus));

    // Focus is drawn on the current tab only
    const WidgetState other = WidgetState::forTab(0, 3, 1, -1, false, true);
    EXPECT_EQ(other, WidgetState(WidgetType::Tab, WidgetState::Top | WidgetState::First));
}

TEST(WidgetStateTest, CloseButtonAndBar) {
    EXPECT_EQ(WidgetState::forCloseButton(false, true),
              WidgetState(WidgetType::CloseButton, WidgetState::Top | WidgetState::Hover));
    EXPECT_EQ(WidgetState::forTabBar(true), WidgetState(WidgetType::TabBar, WidgetState::Bottom));
    EXPECT_EQ(WidgetState::forTabBar(true).with(WidgetState::Hover).without(WidgetState::Hover),
              WidgetState::forTabBar(true));
}

TEST(WidgetStateTest, DescribesItselfAsSelector) {
    EXPECT_EQ(WidgetState::forTab(0, 2, 0, -1, false).toString(),
              QString("QTabBar::tab:top:first:selected"));
    EXPECT_EQ(WidgetState::forCloseButton(true, true).toString(),
              QString("QTabBar::close-button:bottom:hover"));
}

TEST(StyleSelectorTest, ParsesTabWithStates) {
    const StyleSelector selector = parsed("QTabBar::tab:top:!selected");

    EXPECT_EQ(selector.type(), WidgetType::Tab);
    ASSERT_EQ(selector.states().size(), 2);
    EXPECT_EQ(selector.states().at(0).flag, WidgetState::Top);
    EXPECT_FALSE(selector.states().at(0).negated);
    EXPECT_EQ(selector.states().at(1).flag, WidgetState::Selected);
    EXPECT_TRUE(selector.states().at(1).negated);
    EXPECT_EQ(selector, StyleSelector(WidgetType::Tab).is(WidgetState::Top).isNot(WidgetState::Selected));
    EXPECT_EQ(selector.toString(), QString("QTabBar::tab:top:!selected"));
}

TEST(StyleSelectorTest, ParsesBarAndCloseButton) {
    EXPECT_EQ(parsed("QTabBar"), StyleSelector(WidgetType::TabBar));
    EXPECT_EQ(parsed("  QTabBar::close-button:hover "),
              StyleSelector(WidgetType::CloseButton).is(WidgetState::Hover));
    EXPECT_EQ(parsed("QTabBar::tab:only-one"), StyleSelector(WidgetType::Tab).is(WidgetState::OnlyOne));
}

TEST(StyleSelectorTest, RejectsWhatItCannotMatch) {
    EXPECT_TRUE(parseError("QTabWidget::pane").contains("does not target the tab bar"));
    EXPECT_TRUE(parseError("QTabBar::scroller").contains("unsupported sub-control"));
    EXPECT_TRUE(parseError("QTabBar::tab:pressed").contains("unsupported pseudo-state"));
    EXPECT_TRUE(parseError("QTabBar QToolButton").contains("combinators"));
    EXPECT_TRUE(parseError("QTabBar::tab:").contains("empty pseudo-state"));
    EXPECT_TRUE(parseError("").contains("empty selector"));
}

TEST(StyleSelectorTest, SpecificityCountsTypeSubControlAndStates) {
    EXPECT_EQ(parsed("QTabBar").specificity(), 1);
    EXPECT_EQ(parsed("QTabBar::tab").specificity(), 2);
    EXPECT_EQ(parsed("QTabBar::close-button:hover").specificity(), 12);
    EXPECT_EQ(parsed("QTabBar::tab:top:!selected:hover").specificity(), 32);
}

TEST(StyleSelectorTest, MatchesRequiresEveryState) {
    const StyleSelector selector = parsed("QTabBar::tab:top:!selected");

    EXPECT_TRUE(selector.matches(WidgetState::forTab(1, 3, 0, -1, false)));
    EXPECT_FALSE(selector.matches(WidgetState::forTab(0, 3, 0, -1, false)));
    EXPECT_FALSE(selector.matches(WidgetState::forTab(1, 3, 0, -1, true)));
}

TEST(StyleSelectorTest, NegatedPosition) {
    const StyleSelector notLast = parsed("QTabBar::tab:!last");

    EXPECT_TRUE(notLast.matches(WidgetState::forTab(0, 1, 0, -1, false)));
    EXPECT_TRUE(notLast.matches(WidgetState::forTab(0, 3, 0, -1, false)));
    EXPECT_FALSE(notLast.matches(WidgetState::forTab(2, 3, 0, -1, false)));
}

TEST(StyleSelectorTest, TypeMustMatch) {
    EXPECT_FALSE(parsed("QTabBar::tab").matches(WidgetState::forCloseButton(false, false)));
    EXPECT_FALSE(parsed("QTabBar").matches(WidgetState::forTab(0, 1, 0, -1, false)));
    EXPECT_TRUE(parsed("QTabBar::close-button").matches(WidgetState::forCloseButton(true, true)));
}
