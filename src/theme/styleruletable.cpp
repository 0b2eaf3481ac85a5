#include "theme/styleruletable.h"

#include <algorithm>

PropertySet::PropertySet(std::initializer_list<std::pair<QString, PropertyValue>> entries)
{
    for (const auto &entry : entries) {
        insert(entry.first, entry.second);
    }
}

int PropertySet::indexOf(const QString &name) const
{
    const QString key = name.trimmed().toLower();
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries.at(i).first == key) return i;
    }
    return -1;
}

void PropertySet::insert(const QString &name, const PropertyValue &value)
{
    const int index = indexOf(name);
    if (index >= 0) {
        m_entries[index].second = value;
    } else {
        m_entries.append(qMakePair(name.trimmed().toLower(), value));
    }
}

void PropertySet::merge(const PropertySet &other)
{
    for (const auto &entry : other.m_entries) {
        insert(entry.first, entry.second);
    }
}

bool PropertySet::contains(const QString &name) const
{
    return indexOf(name) >= 0;
}

PropertyValue PropertySet::value(const QString &name, const PropertyValue &fallback) const
{
    const int index = indexOf(name);
    return index >= 0 ? m_entries.at(index).second : fallback;
}

QStringList PropertySet::names() const
{
    QStringList out;
    for (const auto &entry : m_entries) out << entry.first;
    return out;
}

QString PropertySet::toString(const QString &indent) const
{
    QString out;
    for (const auto &entry : m_entries) {
        out += indent + entry.first + QLatin1String(": ") + entry.second.toString() + QLatin1String(";\n");
    }
    return out;
}

StyleRuleTable::StyleRuleTable(const QList<StyleRule> &rules)
    : m_rules(rules)
{
}

QList<StyleRule> StyleRuleTable::matchingRules(const WidgetState &state) const
{
    QList<StyleRule> matched;
    for (const StyleRule &rule : m_rules) {
        if (rule.selector.matches(state)) matched.append(rule);
    }
    // Stable: declaration order breaks specificity ties
    std::stable_sort(matched.begin(), matched.end(), [](const StyleRule &a, const StyleRule &b) {
        return a.selector.specificity() < b.selector.specificity();
    });
    return matched;
}

PropertySet StyleRuleTable::resolve(const WidgetState &state) const
{
    PropertySet resolved;
    for (const StyleRule &rule : matchingRules(state)) {
        resolved.merge(rule.properties);
    }
    return resolved;
}

QString StyleRuleTable::toStyleSheet() const
{
    QStringList blocks;
    for (const StyleRule &rule : m_rules) {
        blocks << rule.selector.toString() + QLatin1String(" {\n")
                  + rule.properties.toString(QStringLiteral("    ")) + QLatin1String("}\n");
    }
    return blocks.join(QLatin1Char('\n'));
}
