#ifndef STYLESELECTOR_H
#define STYLESELECTOR_H

#include <QFlags>
#include <QList>
#include <QString>

// Elements of the document tab bar a rule can target
enum class WidgetType {
    TabBar,       // QTabBar
    Tab,          // QTabBar::tab
    CloseButton   // QTabBar::close-button
};

// Concrete state of one element at paint time, owned and updated by the toolkit.
// Position flags follow QStyleOptionTab: exactly one of First, Middle, Last, OnlyOne is set on a tab.
class WidgetState {
public:
    enum Flag {
        NoFlags  = 0x000,
        Top      = 0x001,
        Bottom   = 0x002,
        Selected = 0x004,
        Hover    = 0x008,
        Focus    = 0x010,
        First    = 0x020,
        Middle   = 0x040,
        Last     = 0x080,
        OnlyOne  = 0x100
    };
    Q_DECLARE_FLAGS(Flags, Flag)

    WidgetState() = default;
    WidgetState(WidgetType type, Flags flags) : m_type(type), m_flags(flags) {}

    static WidgetState forTabBar(bool bottom);
    // index/count/current/hovered as reported by QTabBar; hovered and current may be -1
    static WidgetState forTab(int index, int count, int current, int hovered, bool bottom, bool focused = false);
    static WidgetState forCloseButton(bool bottom, bool hovered);

    WidgetType type() const { return m_type; }
    Flags flags() const { return m_flags; }
    bool testFlag(Flag flag) const { return m_flags.testFlag(flag); }

    WidgetState with(Flag flag) const { return WidgetState(m_type, m_flags | flag); }
    WidgetState without(Flag flag) const { return WidgetState(m_type, m_flags & ~Flags(flag)); }

    QString toString() const;

    bool operator==(const WidgetState &other) const { return m_type == other.m_type && m_flags == other.m_flags; }
    bool operator!=(const WidgetState &other) const { return !(*this == other); }

private:
    WidgetType m_type = WidgetType::TabBar;
    Flags m_flags;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(WidgetState::Flags)

// One ":name" or ":!name" qualifier of a selector
struct PseudoState {
    WidgetState::Flag flag = WidgetState::NoFlags;
    bool negated = false;

    bool operator==(const PseudoState &other) const { return flag == other.flag && negated == other.negated; }
    bool operator!=(const PseudoState &other) const { return !(*this == other); }
};

// Predicate over widget type and state flags, e.g. QTabBar::tab:top:!selected
class StyleSelector {
public:
    StyleSelector() = default;
    explicit StyleSelector(WidgetType type, const QList<PseudoState> &states = QList<PseudoState>());

    WidgetType type() const { return m_type; }
    const QList<PseudoState> &states() const { return m_states; }

    StyleSelector is(WidgetState::Flag flag) const;
    StyleSelector isNot(WidgetState::Flag flag) const;

    bool matches(const WidgetState &state) const;

    // CSS2 specificity as the Qt style engine computes it: 10 per pseudo-state,
    // 1 for the type selector and 1 for the sub-control.
    int specificity() const;

    QString toString() const;
    static bool parse(const QString &text, StyleSelector *selector, QString *error = nullptr);

    static QString typeName(WidgetType type);
    static QString pseudoName(WidgetState::Flag flag);
    static WidgetState::Flag pseudoFromName(const QString &name, bool *ok = nullptr);

    bool operator==(const StyleSelector &other) const { return m_type == other.m_type && m_states == other.m_states; }
    bool operator!=(const StyleSelector &other) const { return !(*this == other); }

private:
    WidgetType m_type = WidgetType::TabBar;
    QList<PseudoState> m_states;
};

#endif // STYLESELECTOR_H
