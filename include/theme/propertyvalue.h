#ifndef PROPERTYVALUE_H
#define PROPERTYVALUE_H

#include "theme/gradient.h"

#include <QColor>
#include <QString>

// Value of one stylesheet declaration.
// Shorthands ("1px solid #A0A0A0") and keywords are kept as Text.
class PropertyValue {
public:
    enum Kind {
        Invalid,
        Length,     // NNpx or a bare 0
        Color,      // #RRGGBB, #RGB, #AARRGGBB, color name, rgb()/rgba()
        Gradient,   // qlineargradient(...)
        Url,        // url(:/icons/...)
        Text
    };

    PropertyValue() = default;

    static PropertyValue length(int pixels);
    static PropertyValue color(const QColor &color);
    static PropertyValue gradient(const GradientDescriptor &gradient);
    static PropertyValue url(const QString &path);
    static PropertyValue text(const QString &text);

    // Classify a declaration value. Never fails: unrecognized text becomes Text.
    static PropertyValue fromString(const QString &text);

    Kind kind() const { return m_kind; }
    bool isValid() const { return m_kind != Invalid; }

    int toLength() const { return m_length; }
    QColor toColor() const { return m_color; }
    GradientDescriptor toGradient() const { return m_gradient; }
    // Resource or file path of a Url value, without the url() wrapper
    QString toUrl() const { return m_kind == Url ? m_text : QString(); }

    // Text as written in the stylesheet
    QString toString() const;

    static QString kindName(Kind kind);

    bool operator==(const PropertyValue &other) const;
    bool operator!=(const PropertyValue &other) const { return !(*this == other); }

private:
    Kind m_kind = Invalid;
    QString m_text;
    int m_length = 0;
    QColor m_color;
    GradientDescriptor m_gradient;
};

#endif // PROPERTYVALUE_H
