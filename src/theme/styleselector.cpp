#include "theme/styleselector.h"

#include <QStringList>

namespace {

struct PseudoName {
    WidgetState::Flag flag;
    const char *name;
};

// Order is the order toString() writes qualifiers in
const PseudoName kPseudoNames[] = {
    { WidgetState::Top,      "top" },
    { WidgetState::Bottom,   "bottom" },
    { WidgetState::First,    "first" },
    { WidgetState::Middle,   "middle" },
    { WidgetState::Last,     "last" },
    { WidgetState::OnlyOne,  "only-one" },
    { WidgetState::Selected, "selected" },
    { WidgetState::Hover,    "hover" },
    { WidgetState::Focus,    "focus" },
};

const char *kTabBarClass = "QTabBar";

} // namespace

WidgetState WidgetState::forTabBar(bool bottom)
{
    return WidgetState(WidgetType::TabBar, bottom ? Bottom : Top);
}

WidgetState WidgetState::forTab(int index, int count, int current, int hovered, bool bottom, bool focused)
{
    Flags flags = bottom ? Bottom : Top;
    if (count <= 1) {
        flags |= OnlyOne;
    } else if (index == 0) {
        flags |= First;
    } else if (index == count - 1) {
        flags |= Last;
    } else {
        flags |= Middle;
    }
    if (index == current) {
        flags |= Selected;
        if (focused) flags |= Focus;
    }
    if (hovered >= 0 && index == hovered) flags |= Hover;
    return WidgetState(WidgetType::Tab, flags);
}

WidgetState WidgetState::forCloseButton(bool bottom, bool hovered)
{
    Flags flags = bottom ? Bottom : Top;
    if (hovered) flags |= Hover;
    return WidgetState(WidgetType::CloseButton, flags);
}

QString WidgetState::toString() const
{
    QString out = StyleSelector::typeName(m_type);
    for (const PseudoName &entry : kPseudoNames) {
        if (m_flags.testFlag(entry.flag)) {
            out += QLatin1Char(':');
            out += QLatin1String(entry.name);
        }
    }
    return out;
}

StyleSelector::StyleSelector(WidgetType type, const QList<PseudoState> &states)
    : m_type(type)
    , m_states(states)
{
}

StyleSelector StyleSelector::is(WidgetState::Flag flag) const
{
    StyleSelector copy(*this);
    PseudoState state;
    state.flag = flag;
    copy.m_states.append(state);
    return copy;
}

StyleSelector StyleSelector::isNot(WidgetState::Flag flag) const
{
    StyleSelector copy(*this);
    PseudoState state;
    state.flag = flag;
    state.negated = true;
    copy.m_states.append(state);
    return copy;
}

bool StyleSelector::matches(const WidgetState &state) const
{
    if (state.type() != m_type) return false;
    for (const PseudoState &pseudo : m_states) {
        if (state.testFlag(pseudo.flag) == pseudo.negated) return false;
    }
    return true;
}

int StyleSelector::specificity() const
{
    int value = 1; // type selector
    if (m_type != WidgetType::TabBar) value += 1; // sub-control
    value += 10 * m_states.size();
    return value;
}

QString StyleSelector::typeName(WidgetType type)
{
    switch (type) {
    case WidgetType::TabBar: return QString::fromLatin1(kTabBarClass);
    case WidgetType::Tab: return QString::fromLatin1(kTabBarClass) + QLatin1String("::tab");
    case WidgetType::CloseButton: return QString::fromLatin1(kTabBarClass) + QLatin1String("::close-button");
    }
    return QString();
}

QString StyleSelector::pseudoName(WidgetState::Flag flag)
{
    for (const PseudoName &entry : kPseudoNames) {
        if (entry.flag == flag) return QLatin1String(entry.name);
    }
    return QString();
}

WidgetState::Flag StyleSelector::pseudoFromName(const QString &name, bool *ok)
{
    for (const PseudoName &entry : kPseudoNames) {
        if (name.compare(QLatin1String(entry.name), Qt::CaseInsensitive) == 0) {
            if (ok) *ok = true;
            return entry.flag;
        }
    }
    if (ok) *ok = false;
    return WidgetState::NoFlags;
}

QString StyleSelector::toString() const
{
    QString out = typeName(m_type);
    for (const PseudoState &pseudo : m_states) {
        out += QLatin1Char(':');
        if (pseudo.negated) out += QLatin1Char('!');
        out += pseudoName(pseudo.flag);
    }
    return out;
}

bool StyleSelector::parse(const QString &text, StyleSelector *selector, QString *error)
{
    auto fail = [error](const QString &why) {
        if (error) *error = why;
        return false;
    };

    const QString t = text.trimmed();
    if (t.isEmpty()) return fail(QStringLiteral("empty selector"));
    for (const QChar ch : t) {
        if (ch.isSpace() || ch == QLatin1Char('>') || ch == QLatin1Char('+') || ch == QLatin1Char('~')) {
            return fail(QStringLiteral("combinators are not supported - %1").arg(t));
        }
    }

    const int firstColon = t.indexOf(QLatin1Char(':'));
    const QString className = firstColon < 0 ? t : t.left(firstColon);
    if (className != QLatin1String(kTabBarClass)) {
        return fail(QStringLiteral("selector does not target the tab bar - %1").arg(t));
    }

    WidgetType type = WidgetType::TabBar;
    QString rest = firstColon < 0 ? QString() : t.mid(firstColon);
    if (rest.startsWith(QLatin1String("::"))) {
        rest = rest.mid(2);
        const int next = rest.indexOf(QLatin1Char(':'));
        const QString subControl = next < 0 ? rest : rest.left(next);
        if (subControl == QLatin1String("tab")) {
            type = WidgetType::Tab;
        } else if (subControl == QLatin1String("close-button")) {
            type = WidgetType::CloseButton;
        } else {
            return fail(QStringLiteral("unsupported sub-control %1 - %2").arg(subControl, t));
        }
        rest = next < 0 ? QString() : rest.mid(next);
    }

    QList<PseudoState> states;
    if (!rest.isEmpty()) {
        // rest starts with ':'
        const QStringList parts = rest.mid(1).split(QLatin1Char(':'));
        for (QString part : parts) {
            PseudoState pseudo;
            if (part.startsWith(QLatin1Char('!'))) {
                pseudo.negated = true;
                part = part.mid(1);
            }
            if (part.isEmpty()) {
                return fail(QStringLiteral("empty pseudo-state - %1").arg(t));
            }
            bool known = false;
            pseudo.flag = pseudoFromName(part, &known);
            if (!known) {
                return fail(QStringLiteral("unsupported pseudo-state %1 - %2").arg(part, t));
            }
            states.append(pseudo);
        }
    }

    if (selector) *selector = StyleSelector(type, states);
    if (error) error->clear();
    return true;
}
