#ifndef GRADIENT_H
#define GRADIENT_H

#include <QColor>
#include <QLinearGradient>
#include <QList>
#include <QPointF>
#include <QString>

struct GradientStop {
    qreal offset = 0.0;
    QColor color;

    bool operator==(const GradientStop &other) const {
        return qFuzzyCompare(offset + 1.0, other.offset + 1.0) && color == other.color;
    }
    bool operator!=(const GradientStop &other) const { return !(*this == other); }
};

// Linear gradient as written in a stylesheet:
//   qlineargradient(x1: 0, y1: 0, x2: 0, y2: 1, stop: 0 #F8F8F8, stop: 1 #EDEDED)
// Coordinates are relative to the bounding box of the painted element.
class GradientDescriptor {
public:
    GradientDescriptor() = default;
    GradientDescriptor(const QPointF &start, const QPointF &finalStop,
                       const QList<GradientStop> &stops = QList<GradientStop>());

    // Top to bottom, two stops
    static GradientDescriptor vertical(const QColor &from, const QColor &to);

    QPointF start() const { return m_start; }
    QPointF finalStop() const { return m_finalStop; }
    const QList<GradientStop> &stops() const { return m_stops; }

    GradientDescriptor withStop(qreal offset, const QColor &color) const;
    // Same stops along the opposite direction
    GradientDescriptor reversed() const;

    // At least two stops, offsets in [0,1] and non-decreasing, valid colors, non-degenerate axis.
    bool isValid(QString *reason = nullptr) const;
    bool hasOrderedStops() const;

    QColor firstColor() const;
    QColor lastColor() const;

    QString toString() const;
    static GradientDescriptor fromString(const QString &text, bool *ok = nullptr, QString *error = nullptr);
    static bool isGradientFunction(const QString &text);

    // Object bounding mode gradient, ready for a QBrush
    QLinearGradient toLinearGradient() const;

    bool operator==(const GradientDescriptor &other) const;
    bool operator!=(const GradientDescriptor &other) const { return !(*this == other); }

private:
    QPointF m_start;
    QPointF m_finalStop;
    QList<GradientStop> m_stops;
};

#endif // GRADIENT_H
