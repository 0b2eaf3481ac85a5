#ifndef TABBARTHEME_H
#define TABBARTHEME_H

#include "theme/styleruletable.h"

#include <QColor>
#include <QString>

// Built-in look of the document tab bar. The bundled resource
// (resourcePath()) carries the same rules as defaultTable().
class TabBarTheme {
public:
    static QString resourcePath();
    static QString closeIconPath();
    static QString closeHoverIconPath();

    static StyleRuleTable defaultTable();

    // Gradient endpoints, top orientation
    static QColor selectedTop() { return QColor(0xF8, 0xF8, 0xF8); }
    static QColor selectedBottom() { return QColor(0xED, 0xED, 0xED); }
    static QColor unselectedTop() { return QColor(0xD0, 0xD0, 0xD0); }
    static QColor unselectedBottom() { return QColor(0xC3, 0xC3, 0xC3); }
    static QColor hoverTop() { return QColor(0xDC, 0xDC, 0xDC); }
    static QColor hoverBottom() { return QColor(0xD0, 0xD0, 0xD0); }
    static QColor closeHoverTop() { return QColor(0xE0, 0xE0, 0xE0); }
    static QColor closeHoverBottom() { return QColor(0xC0, 0xC0, 0xC0); }
};

#endif // TABBARTHEME_H
