#ifndef QSSTEXT_H
#define QSSTEXT_H

#include <QColor>
#include <QString>
#include <QStringList>

// Small text helpers shared by the stylesheet reader and the value parsers.
namespace QssText {

// Remove /* ... */ blocks, keeping their line breaks. Sets *unterminated when a comment runs to the end of the text.
QString stripComments(const QString &text, bool *unterminated = nullptr);

// Split on separator, ignoring separators nested inside (), [] or quotes.
// Parts are trimmed; empty parts are dropped.
QStringList splitTopLevel(const QString &text, QChar separator);

// Index of the first separator outside (), [] or quotes, or -1.
int indexOfTopLevel(const QString &text, QChar separator, int from = 0);

// Strip a function wrapper like "url(...)" and return the argument text, trimmed.
// Returns a null string when text is not a call of the given function.
QString functionArgument(const QString &text, const QString &function);

// Color literal: #RGB, #RRGGBB, #AARRGGBB, an SVG color name, rgb(r, g, b) or rgba(r, g, b, a).
// Returns an invalid QColor for anything else.
QColor parseColor(const QString &text);

// Inverse of parseColor for the forms the theme files use (#RRGGBB, or #AARRGGBB with alpha).
QString formatColor(const QColor &color);

// Format a gradient coordinate or stop offset the way stylesheets write them (0, 0.5, 1).
QString formatNumber(double value);

} // namespace QssText

#endif // QSSTEXT_H
