#include "theme/tabbartheme.h"

namespace {

PropertyValue px(int pixels) { return PropertyValue::length(pixels); }
PropertyValue color(QRgb rgb) { return PropertyValue::color(QColor(rgb)); }
PropertyValue text(const char *value) { return PropertyValue::text(QString::fromLatin1(value)); }
PropertyValue url(const QString &path) { return PropertyValue::url(path); }

PropertyValue verticalGradient(const QColor &from, const QColor &to, bool bottomUp)
{
    const GradientDescriptor gradient = GradientDescriptor::vertical(from, to);
    return PropertyValue::gradient(bottomUp ? gradient.reversed() : gradient);
}

} // namespace

QString TabBarTheme::resourcePath()
{
    return QStringLiteral(":/styles/tabbar.qss");
}

QString TabBarTheme::closeIconPath()
{
    return QStringLiteral(":/icons/close");
}

QString TabBarTheme::closeHoverIconPath()
{
    return QStringLiteral(":/icons/close-hover");
}

StyleRuleTable TabBarTheme::defaultTable()
{
    const StyleSelector bar(WidgetType::TabBar);
    const StyleSelector tab(WidgetType::Tab);
    const StyleSelector closeButton(WidgetType::CloseButton);

    QList<StyleRule> rules;

    rules << StyleRule(bar, {
        { "background", color(0xD6D6D6) },
        { "border", px(0) },
    });

    // Tab
    rules << StyleRule(tab, {
        { "border", text("1px solid #A0A0A0") },
        { "color", color(0x000000) },
        { "height", px(24) },
        { "min-width", px(100) },
        { "padding", text("0 8px 0 8px") },
    });
    rules << StyleRule(tab.isNot(WidgetState::Selected), {
        { "color", color(0x505050) },
    });
    rules << StyleRule(tab.is(WidgetState::Focus), {
        { "border-color", color(0x7A7A7A) },
    });

    // Top and bottom orientation mirror each other
    for (const bool bottom : { false, true }) {
        const WidgetState::Flag side = bottom ? WidgetState::Bottom : WidgetState::Top;
        if (bottom) {
            rules << StyleRule(tab.is(side), {
                { "border-top", px(0) },
                { "border-bottom-left-radius", px(2) },
                { "border-bottom-right-radius", px(2) },
                { "margin-bottom", px(2) },
            });
        } else {
            rules << StyleRule(tab.is(side), {
                { "border-bottom", px(0) },
                { "border-top-left-radius", px(2) },
                { "border-top-right-radius", px(2) },
                { "margin-top", px(2) },
            });
        }
        rules << StyleRule(tab.is(side).is(WidgetState::Selected), {
            { "background", verticalGradient(selectedTop(), selectedBottom(), bottom) },
        });
        rules << StyleRule(tab.is(side).isNot(WidgetState::Selected), {
            { "background", verticalGradient(unselectedTop(), unselectedBottom(), bottom) },
            { bottom ? "margin-bottom" : "margin-top", px(4) },
        });
        rules << StyleRule(tab.is(side).isNot(WidgetState::Selected).is(WidgetState::Hover), {
            { "background", verticalGradient(hoverTop(), hoverBottom(), bottom) },
        });
    }

    // Position in group
    rules << StyleRule(tab.isNot(WidgetState::Last), {
        { "margin-right", px(-1) },
    });
    rules << StyleRule(tab.is(WidgetState::OnlyOne), {
        { "margin-right", px(0) },
    });
    rules << StyleRule(tab.is(WidgetState::Last), {
        { "margin-right", px(0) },
    });
    rules << StyleRule(tab.is(WidgetState::OnlyOne), {
        { "min-width", px(120) },
    });

    // Close button
    rules << StyleRule(closeButton, {
        { "image", url(closeIconPath()) },
        { "subcontrol-position", text("right") },
        { "height", px(12) },
        { "width", px(12) },
        { "padding", px(1) },
    });
    rules << StyleRule(closeButton.is(WidgetState::Hover), {
        { "image", url(closeHoverIconPath()) },
        { "border-radius", px(2) },
        { "background", verticalGradient(closeHoverTop(), closeHoverBottom(), false) },
    });

    return StyleRuleTable(rules);
}
