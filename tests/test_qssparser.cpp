#include <gtest/gtest.h>

#include "testutils.h"
#include "theme/qssparser.h"

namespace {

bool anyContains(const QStringList &warnings, const QString &needle)
{
    for (const QString &warning : warnings) {
        if (warning.contains(needle)) return true;
    }
    return false;
}

} // namespace

TEST(QssParserTest, ReadsRulesAroundComments) {
    const QssParser::Result result = QssParser::parse(
        "/* tabs */\n"
        "QTabBar::tab { height: 24px; /* inline */ color: #505050 }\n");

    EXPECT_TRUE(result.warnings.isEmpty()) << result.warnings.join("\n").toStdString();
    ASSERT_EQ(result.table.size(), 1);
    const StyleRule &rule = result.table.rules().at(0);
    EXPECT_EQ(rule.selector, StyleSelector(WidgetType::Tab));
    EXPECT_EQ(rule.properties.value("height"), PropertyValue::length(24));
    EXPECT_EQ(rule.properties.value("color").toColor(), QColor(0x50, 0x50, 0x50));
}

TEST(QssParserTest, SelectorListSharesDeclarations) {
    const QssParser::Result result = QssParser::parse(
        "QTabBar::tab:only-one,\nQTabBar::tab:last { margin-right: 0; }");

    ASSERT_EQ(result.table.size(), 2);
    EXPECT_EQ(result.table.rules().at(0).selector, StyleSelector(WidgetType::Tab).is(WidgetState::OnlyOne));
    EXPECT_EQ(result.table.rules().at(1).selector, StyleSelector(WidgetType::Tab).is(WidgetState::Last));
    EXPECT_EQ(result.table.rules().at(0).properties, result.table.rules().at(1).properties);
}

TEST(QssParserTest, SkipsOtherWidgetsWithWarning) {
    const QssParser::Result result = QssParser::parse(
        "QTabWidget::pane { border: 0 }\n"
        "QTabWidget::pane, QTabBar { background: #D6D6D6; }\n");

    ASSERT_EQ(result.table.size(), 1);
    EXPECT_EQ(result.table.rules().at(0).selector, StyleSelector(WidgetType::TabBar));
    ASSERT_EQ(result.warnings.size(), 2);
    EXPECT_TRUE(result.warnings.at(0).startsWith("line 1:"));
    EXPECT_TRUE(result.warnings.at(1).startsWith("line 2:"));
}

TEST(QssParserTest, BadDeclarationsAreDropped) {
    const QssParser::Result result = QssParser::parse(
        "QTabBar {\n"
        "    background #FFFFFF;\n"
        "    color: ;\n"
        "    border: 0;\n"
        "}\n");

    ASSERT_EQ(result.table.size(), 1);
    EXPECT_EQ(result.table.rules().at(0).properties.names(), QStringList({ "border" }));
    EXPECT_TRUE(anyContains(result.warnings, "declaration without a property name"));
    EXPECT_TRUE(anyContains(result.warnings, "property color has no value"));
}

TEST(QssParserTest, UnreadableGradientIsKeptAsText) {
    const QssParser::Result result = QssParser::parse(
        "QTabBar { background: qlineargradient(x1: 0, stop: 0); }");

    ASSERT_EQ(result.table.size(), 1);
    EXPECT_EQ(result.table.rules().at(0).properties.value("background").kind(), PropertyValue::Text);
    EXPECT_TRUE(anyContains(result.warnings, "unreadable gradient"));
}

TEST(QssParserTest, SemicolonInsideUrlDoesNotSplit) {
    const QssParser::Result result = QssParser::parse(
        "QTabBar::close-button { image: url(data:image/svg+xml;base64,AAAA); width: 12px; }");

    ASSERT_EQ(result.table.size(), 1);
    const PropertySet &properties = result.table.rules().at(0).properties;
    EXPECT_EQ(properties.value("image").toUrl(), QString("data:image/svg+xml;base64,AAAA"));
    EXPECT_EQ(properties.value("width"), PropertyValue::length(12));
}

TEST(QssParserTest, NestedBlockIsSkipped) {
    const QssParser::Result result = QssParser::parse(
        "QTabBar { QTabBar::tab { color: red; } }\n"
        "QTabBar::tab { height: 20px; }\n");

    ASSERT_EQ(result.table.size(), 1);
    EXPECT_EQ(result.table.rules().at(0).properties.value("height"), PropertyValue::length(20));
    EXPECT_TRUE(anyContains(result.warnings, "nested block"));
}

TEST(QssParserTest, UnterminatedInputIsReported) {
    const QssParser::Result block = QssParser::parse("QTabBar { border: 0;\n");
    EXPECT_TRUE(block.table.isEmpty());
    EXPECT_TRUE(anyContains(block.warnings, "unterminated declaration block"));

    const QssParser::Result comment = QssParser::parse("QTabBar { border: 0; }\n/* trailing");
    EXPECT_EQ(comment.table.size(), 1);
    EXPECT_TRUE(anyContains(comment.warnings, "unterminated comment"));

    const QssParser::Result trailing = QssParser::parse("QTabBar { border: 0; }\nQTabBar::tab");
    EXPECT_TRUE(anyContains(trailing.warnings, "without a declaration block"));
}

TEST(QssParserTest, WarningsCarrySourceLines) {
    const QssParser::Result result = QssParser::parse(
        "/* line one\n   line two */\n"
        "QTabBar::tab:pressed { color: red; }\n");

    ASSERT_EQ(result.warnings.size(), 1);
    EXPECT_TRUE(result.warnings.at(0).startsWith("line 3:")) << result.warnings.at(0).toStdString();
}

TEST(QssParserTest, MissingFileFails) {
    QssParser::Result result;
    QString error;

    EXPECT_FALSE(QssParser::parseFile("/nonexistent/tabbar.qss", &result, &error));
    EXPECT_TRUE(error.contains("/nonexistent/tabbar.qss"));
}
