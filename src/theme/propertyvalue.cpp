#include "theme/propertyvalue.h"
#include "theme/qsstext.h"

#include <QRegularExpression>

PropertyValue PropertyValue::length(int pixels)
{
    PropertyValue value;
    value.m_kind = Length;
    value.m_length = pixels;
    return value;
}

PropertyValue PropertyValue::color(const QColor &color)
{
    PropertyValue value;
    value.m_kind = Color;
    value.m_color = color;
    value.m_text = QssText::formatColor(color);
    return value;
}

PropertyValue PropertyValue::gradient(const GradientDescriptor &gradient)
{
    PropertyValue value;
    value.m_kind = Gradient;
    value.m_gradient = gradient;
    return value;
}

PropertyValue PropertyValue::url(const QString &path)
{
    PropertyValue value;
    value.m_kind = Url;
    value.m_text = path.trimmed();
    return value;
}

PropertyValue PropertyValue::text(const QString &text)
{
    PropertyValue value;
    value.m_kind = Text;
    value.m_text = text.simplified();
    return value;
}

PropertyValue PropertyValue::fromString(const QString &text)
{
    const QString t = text.trimmed();
    if (t.isEmpty()) return PropertyValue();

    static const QRegularExpression lengthPattern(QStringLiteral("^(-?\\d+)(px)?$"));
    const QRegularExpressionMatch lengthMatch = lengthPattern.match(t);
    if (lengthMatch.hasMatch()) {
        // A bare number is only a length when it is zero; other unitless numbers stay text
        bool inRange = false;
        const int pixels = lengthMatch.captured(1).toInt(&inRange);
        if (inRange && (!lengthMatch.captured(2).isEmpty() || pixels == 0)) {
            return length(pixels);
        }
        return PropertyValue::text(t);
    }

    if (GradientDescriptor::isGradientFunction(t)) {
        bool ok = false;
        const GradientDescriptor descriptor = GradientDescriptor::fromString(t, &ok);
        if (ok) return gradient(descriptor);
        return PropertyValue::text(t);
    }

    const QString urlArg = QssText::functionArgument(t, QStringLiteral("url"));
    if (!urlArg.isNull()) {
        QString path = urlArg;
        if (path.size() >= 2 && (path.startsWith(QLatin1Char('"')) || path.startsWith(QLatin1Char('\'')))
            && path.endsWith(path.at(0))) {
            path = path.mid(1, path.size() - 2);
        }
        return url(path);
    }

    // A '#' token is always meant as a color; keep it even when malformed so it can be reported
    if (t.startsWith(QLatin1Char('#')) && !t.contains(QLatin1Char(' '))) {
        PropertyValue value;
        value.m_kind = Color;
        value.m_color = QssText::parseColor(t);
        value.m_text = value.m_color.isValid() ? QssText::formatColor(value.m_color) : t;
        return value;
    }

    const QColor parsed = QssText::parseColor(t);
    if (parsed.isValid()) {
        PropertyValue value = color(parsed);
        // Keep names such as "transparent" as written
        if (!t.startsWith(QLatin1Char('#'))) value.m_text = t;
        return value;
    }

    return PropertyValue::text(t);
}

QString PropertyValue::toString() const
{
    switch (m_kind) {
    case Invalid:
        return QString();
    case Length:
        return m_length == 0 ? QStringLiteral("0") : QStringLiteral("%1px").arg(m_length);
    case Gradient:
        return m_gradient.toString();
    case Url:
        return QStringLiteral("url(%1)").arg(m_text);
    case Color:
    case Text:
        return m_text;
    }
    return QString();
}

QString PropertyValue::kindName(Kind kind)
{
    switch (kind) {
    case Invalid: return QStringLiteral("invalid");
    case Length: return QStringLiteral("length");
    case Color: return QStringLiteral("color");
    case Gradient: return QStringLiteral("gradient");
    case Url: return QStringLiteral("url");
    case Text: return QStringLiteral("text");
    }
    return QString();
}

bool PropertyValue::operator==(const PropertyValue &other) const
{
    if (m_kind != other.m_kind) return false;
    switch (m_kind) {
    case Invalid:
        return true;
    case Length:
        return m_length == other.m_length;
    case Color:
        if (!m_color.isValid() || !other.m_color.isValid()) return m_text == other.m_text;
        return m_color == other.m_color;
    case Gradient:
        return m_gradient == other.m_gradient;
    case Url:
    case Text:
        return m_text == other.m_text;
    }
    return false;
}
