#include "theme/qsstext.h"

namespace QssText {

QString stripComments(const QString &text, bool *unterminated)
{
    if (unterminated) *unterminated = false;

    QString out;
    out.reserve(text.size());
    QChar quote;
    int i = 0;
    while (i < text.size()) {
        const QChar ch = text.at(i);
        if (!quote.isNull()) {
            out.append(ch);
            if (ch == quote) quote = QChar();
            ++i;
            continue;
        }
        if (ch == QLatin1Char('"') || ch == QLatin1Char('\'')) {
            quote = ch;
            out.append(ch);
            ++i;
            continue;
        }
        if (ch == QLatin1Char('/') && i + 1 < text.size() && text.at(i + 1) == QLatin1Char('*')) {
            const int end = text.indexOf(QLatin1String("*/"), i + 2);
            if (end < 0) {
                if (unterminated) *unterminated = true;
                break;
            }
            // Keep a separator so "a/**/b" does not glue tokens together,
            // and the line breaks so positions still map to source lines
            out.append(QLatin1Char(' '));
            out.append(QString(text.mid(i, end - i).count(QLatin1Char('\n')), QLatin1Char('\n')));
            i = end + 2;
            continue;
        }
        out.append(ch);
        ++i;
    }
    return out;
}

int indexOfTopLevel(const QString &text, QChar separator, int from)
{
    int depth = 0;
    QChar quote;
    for (int i = qMax(0, from); i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (!quote.isNull()) {
            if (ch == quote) quote = QChar();
            continue;
        }
        if (depth == 0 && ch == separator) {
            return i;
        } else if (ch == QLatin1Char('"') || ch == QLatin1Char('\'')) {
            quote = ch;
        } else if (ch == QLatin1Char('(') || ch == QLatin1Char('[')) {
            ++depth;
        } else if (ch == QLatin1Char(')') || ch == QLatin1Char(']')) {
            if (depth > 0) --depth;
        }
    }
    return -1;
}

QStringList splitTopLevel(const QString &text, QChar separator)
{
    QStringList parts;
    int start = 0;
    while (start <= text.size()) {
        const int pos = indexOfTopLevel(text, separator, start);
        const QString part = (pos < 0 ? text.mid(start) : text.mid(start, pos - start)).trimmed();
        if (!part.isEmpty()) parts << part;
        if (pos < 0) break;
        start = pos + 1;
    }
    return parts;
}

QString functionArgument(const QString &text, const QString &function)
{
    const QString t = text.trimmed();
    if (!t.startsWith(function, Qt::CaseInsensitive)) return QString();
    const QString rest = t.mid(function.size()).trimmed();
    if (!rest.startsWith(QLatin1Char('(')) || !rest.endsWith(QLatin1Char(')'))) return QString();
    // Make sure the opening parenthesis is closed by the final one
    if (indexOfTopLevel(rest.mid(1, rest.size() - 2), QLatin1Char(')')) >= 0) return QString();
    QString arg = rest.mid(1, rest.size() - 2).trimmed();
    if (arg.isNull()) arg = QLatin1String("");
    return arg;
}

QColor parseColor(const QString &text)
{
    const QString t = text.trimmed();
    if (t.isEmpty()) return QColor();

    const bool hasAlpha = t.startsWith(QLatin1String("rgba"), Qt::CaseInsensitive);
    const QString args = functionArgument(t, hasAlpha ? QStringLiteral("rgba") : QStringLiteral("rgb"));
    if (!args.isNull()) {
        const QStringList parts = splitTopLevel(args, QLatin1Char(','));
        if (parts.size() != (hasAlpha ? 4 : 3)) return QColor();
        int channels[4] = {0, 0, 0, 255};
        for (int i = 0; i < parts.size(); ++i) {
            QString part = parts.at(i);
            bool ok = false;
            int value = 0;
            if (part.endsWith(QLatin1Char('%'))) {
                part.chop(1);
                value = qRound(part.toDouble(&ok) * 255.0 / 100.0);
            } else {
                value = part.toInt(&ok);
            }
            if (!ok || value < 0 || value > 255) return QColor();
            channels[i] = value;
        }
        return QColor(channels[0], channels[1], channels[2], channels[3]);
    }

    if (t.contains(QLatin1Char(' ')) || t.contains(QLatin1Char('('))) return QColor();
    if (t.startsWith(QLatin1Char('#'))) {
        const int digits = t.size() - 1;
        if (digits != 3 && digits != 6 && digits != 8) return QColor();
    }
    return QColor(t);
}

QString formatColor(const QColor &color)
{
    if (!color.isValid()) return QString();
    if (color.alpha() != 255) return color.name(QColor::HexArgb).toUpper();
    return color.name(QColor::HexRgb).toUpper();
}

QString formatNumber(double value)
{
    return QString::number(value, 'g', 6);
}

} // namespace QssText
