#include "theme/gradient.h"
#include "theme/qsstext.h"

#include <QStringList>
#include <QtNumeric>

namespace {
const char *kFunctionName = "qlineargradient";
}

GradientDescriptor::GradientDescriptor(const QPointF &start, const QPointF &finalStop,
                                       const QList<GradientStop> &stops)
    : m_start(start)
    , m_finalStop(finalStop)
    , m_stops(stops)
{
}

GradientDescriptor GradientDescriptor::vertical(const QColor &from, const QColor &to)
{
    return GradientDescriptor(QPointF(0, 0), QPointF(0, 1))
        .withStop(0.0, from)
        .withStop(1.0, to);
}

GradientDescriptor GradientDescriptor::withStop(qreal offset, const QColor &color) const
{
    GradientDescriptor copy(*this);
    GradientStop stop;
    stop.offset = offset;
    stop.color = color;
    copy.m_stops.append(stop);
    return copy;
}

GradientDescriptor GradientDescriptor::reversed() const
{
    return GradientDescriptor(m_finalStop, m_start, m_stops);
}

bool GradientDescriptor::hasOrderedStops() const
{
    qreal previous = 0.0;
    for (const GradientStop &stop : m_stops) {
        if (!(stop.offset >= 0.0 && stop.offset <= 1.0)) return false;
        if (stop.offset < previous) return false;
        previous = stop.offset;
    }
    return true;
}

bool GradientDescriptor::isValid(QString *reason) const
{
    auto fail = [reason](const QString &why) {
        if (reason) *reason = why;
        return false;
    };

    if (m_stops.size() < 2) {
        return fail(QStringLiteral("gradient needs at least two stops, has %1").arg(m_stops.size()));
    }
    if (!qIsFinite(m_start.x()) || !qIsFinite(m_start.y())
        || !qIsFinite(m_finalStop.x()) || !qIsFinite(m_finalStop.y())) {
        return fail(QStringLiteral("gradient axis has a non-finite coordinate"));
    }
    if (m_start == m_finalStop) {
        return fail(QStringLiteral("gradient axis has zero length"));
    }
    qreal previous = 0.0;
    for (int i = 0; i < m_stops.size(); ++i) {
        const GradientStop &stop = m_stops.at(i);
        // Written so that NaN fails as well
        if (!(stop.offset >= 0.0 && stop.offset <= 1.0)) {
            return fail(QStringLiteral("stop %1 offset %2 is outside [0, 1]")
                            .arg(i).arg(QssText::formatNumber(stop.offset)));
        }
        if (stop.offset < previous) {
            return fail(QStringLiteral("stop %1 offset %2 is smaller than the previous offset %3")
                            .arg(i).arg(QssText::formatNumber(stop.offset))
                            .arg(QssText::formatNumber(previous)));
        }
        if (!stop.color.isValid()) {
            return fail(QStringLiteral("stop %1 has an invalid color").arg(i));
        }
        previous = stop.offset;
    }
    if (reason) reason->clear();
    return true;
}

QColor GradientDescriptor::firstColor() const
{
    return m_stops.isEmpty() ? QColor() : m_stops.first().color;
}

QColor GradientDescriptor::lastColor() const
{
    return m_stops.isEmpty() ? QColor() : m_stops.last().color;
}

QString GradientDescriptor::toString() const
{
    QStringList args;
    args << QStringLiteral("x1: %1").arg(QssText::formatNumber(m_start.x()))
         << QStringLiteral("y1: %1").arg(QssText::formatNumber(m_start.y()))
         << QStringLiteral("x2: %1").arg(QssText::formatNumber(m_finalStop.x()))
         << QStringLiteral("y2: %1").arg(QssText::formatNumber(m_finalStop.y()));
    for (const GradientStop &stop : m_stops) {
        args << QStringLiteral("stop: %1 %2")
                    .arg(QssText::formatNumber(stop.offset), QssText::formatColor(stop.color));
    }
    return QString::fromLatin1(kFunctionName) + QLatin1Char('(') + args.join(QLatin1String(", ")) + QLatin1Char(')');
}

bool GradientDescriptor::isGradientFunction(const QString &text)
{
    return !QssText::functionArgument(text, QLatin1String(kFunctionName)).isNull();
}

GradientDescriptor GradientDescriptor::fromString(const QString &text, bool *ok, QString *error)
{
    auto fail = [ok, error](const QString &why) {
        if (ok) *ok = false;
        if (error) *error = why;
        return GradientDescriptor();
    };

    const QString args = QssText::functionArgument(text, QLatin1String(kFunctionName));
    if (args.isNull()) {
        return fail(QStringLiteral("not a %1 function: %2").arg(QLatin1String(kFunctionName), text));
    }

    QPointF start;
    QPointF finalStop;
    QList<GradientStop> stops;
    for (const QString &arg : QssText::splitTopLevel(args, QLatin1Char(','))) {
        const int colon = arg.indexOf(QLatin1Char(':'));
        if (colon < 0) {
            return fail(QStringLiteral("gradient argument without ':' - %1").arg(arg));
        }
        const QString key = arg.left(colon).trimmed().toLower();
        const QString value = arg.mid(colon + 1).trimmed();

        if (key == QLatin1String("stop")) {
            // "0 #F8F8F8", the color may itself be a function such as rgba(...)
            const int space = value.indexOf(QLatin1Char(' '));
            if (space < 0) {
                return fail(QStringLiteral("gradient stop without a color - %1").arg(value));
            }
            bool offsetOk = false;
            GradientStop stop;
            stop.offset = value.left(space).toDouble(&offsetOk);
            stop.color = QssText::parseColor(value.mid(space + 1));
            if (!offsetOk || !qIsFinite(stop.offset)) {
                return fail(QStringLiteral("gradient stop offset is not a number - %1").arg(value));
            }
            if (!stop.color.isValid()) {
                return fail(QStringLiteral("gradient stop color is not a color - %1").arg(value));
            }
            stops.append(stop);
            continue;
        }

        if (key == QLatin1String("spread")) {
            // Only pad spread is used by the theme; accept and ignore the others
            continue;
        }

        bool numberOk = false;
        const double number = value.toDouble(&numberOk);
        if (!numberOk || !qIsFinite(number)) {
            return fail(QStringLiteral("gradient coordinate %1 is not a number - %2").arg(key, value));
        }
        if (key == QLatin1String("x1")) {
            start.setX(number);
        } else if (key == QLatin1String("y1")) {
            start.setY(number);
        } else if (key == QLatin1String("x2")) {
            finalStop.setX(number);
        } else if (key == QLatin1String("y2")) {
            finalStop.setY(number);
        } else {
            return fail(QStringLiteral("unknown gradient argument %1").arg(key));
        }
    }

    if (ok) *ok = true;
    if (error) error->clear();
    return GradientDescriptor(start, finalStop, stops);
}

QLinearGradient GradientDescriptor::toLinearGradient() const
{
    QLinearGradient gradient(m_start, m_finalStop);
    gradient.setCoordinateMode(QGradient::ObjectBoundingMode);
    for (const GradientStop &stop : m_stops) {
        gradient.setColorAt(qBound<qreal>(0.0, stop.offset, 1.0), stop.color);
    }
    return gradient;
}

bool GradientDescriptor::operator==(const GradientDescriptor &other) const
{
    return m_start == other.m_start
        && m_finalStop == other.m_finalStop
        && m_stops == other.m_stops;
}
