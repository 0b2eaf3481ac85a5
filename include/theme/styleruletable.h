#ifndef STYLERULETABLE_H
#define STYLERULETABLE_H

#include "theme/propertyvalue.h"
#include "theme/styleselector.h"

#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>

#include <initializer_list>
#include <utility>

// Ordered mapping of property name to value. Names are stored lower case;
// inserting an existing name replaces its value in place.
class PropertySet {
public:
    PropertySet() = default;
    PropertySet(std::initializer_list<std::pair<QString, PropertyValue>> entries);

    void insert(const QString &name, const PropertyValue &value);
    // Properties of other win over ours
    void merge(const PropertySet &other);

    bool contains(const QString &name) const;
    // Unspecified properties fall back to the toolkit default given by the caller
    PropertyValue value(const QString &name, const PropertyValue &fallback = PropertyValue()) const;

    QStringList names() const;
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

    // "name: value;" lines
    QString toString(const QString &indent = QString()) const;

    bool operator==(const PropertySet &other) const { return m_entries == other.m_entries; }
    bool operator!=(const PropertySet &other) const { return !(*this == other); }

private:
    int indexOf(const QString &name) const;

    QList<QPair<QString, PropertyValue>> m_entries;
};

struct StyleRule {
    StyleRule() = default;
    StyleRule(const StyleSelector &selector, const PropertySet &properties)
        : selector(selector), properties(properties) {}

    StyleSelector selector;
    PropertySet properties;

    bool operator==(const StyleRule &other) const {
        return selector == other.selector && properties == other.properties;
    }
    bool operator!=(const StyleRule &other) const { return !(*this == other); }
};

// Immutable, ordered list of (selector, property set) rules.
// Resolution follows the style sheet cascade: matching rules are applied by
// ascending specificity, and among equal specificity the later rule wins.
class StyleRuleTable {
public:
    StyleRuleTable() = default;
    explicit StyleRuleTable(const QList<StyleRule> &rules);

    const QList<StyleRule> &rules() const { return m_rules; }
    int size() const { return m_rules.size(); }
    bool isEmpty() const { return m_rules.isEmpty(); }

    // Rules that apply to state, in the order they are applied
    QList<StyleRule> matchingRules(const WidgetState &state) const;
    // Merged properties for state; an unmatched state yields an empty set
    PropertySet resolve(const WidgetState &state) const;

    QString toStyleSheet() const;

    bool operator==(const StyleRuleTable &other) const { return m_rules == other.m_rules; }
    bool operator!=(const StyleRuleTable &other) const { return !(*this == other); }

private:
    QList<StyleRule> m_rules;
};

#endif // STYLERULETABLE_H
