#include "theme/qssparser.h"
#include "theme/qsstext.h"

#include <QDebug>
#include <QFile>
#include <QTextStream>

namespace {

int lineAt(const QString &text, int position)
{
    return text.left(position).count(QLatin1Char('\n')) + 1;
}

PropertySet parseDeclarations(const QString &body, int line, QStringList *warnings)
{
    PropertySet properties;
    for (const QString &declaration : QssText::splitTopLevel(body, QLatin1Char(';'))) {
        const int colon = declaration.indexOf(QLatin1Char(':'));
        if (colon <= 0) {
            warnings->append(QStringLiteral("line %1: declaration without a property name - %2")
                                 .arg(line).arg(declaration.simplified()));
            continue;
        }
        const QString name = declaration.left(colon).trimmed();
        const QString valueText = declaration.mid(colon + 1).trimmed();
        if (valueText.isEmpty()) {
            warnings->append(QStringLiteral("line %1: property %2 has no value").arg(line).arg(name));
            continue;
        }

        const PropertyValue value = PropertyValue::fromString(valueText);
        if (GradientDescriptor::isGradientFunction(valueText) && value.kind() != PropertyValue::Gradient) {
            QString error;
            bool ok = false;
            GradientDescriptor::fromString(valueText, &ok, &error);
            warnings->append(QStringLiteral("line %1: property %2 keeps an unreadable gradient - %3")
                                 .arg(line).arg(name, error));
        }
        properties.insert(name, value);
    }
    return properties;
}

} // namespace

QssParser::Result QssParser::parse(const QString &text)
{
    Result result;

    bool unterminatedComment = false;
    const QString source = QssText::stripComments(text, &unterminatedComment);
    if (unterminatedComment) {
        result.warnings << QStringLiteral("line %1: unterminated comment, the rest of the text is ignored")
                               .arg(lineAt(source, source.size()));
    }

    QList<StyleRule> rules;
    int pos = 0;
    while (pos < source.size()) {
        const int open = source.indexOf(QLatin1Char('{'), pos);
        if (open < 0) {
            if (!source.mid(pos).trimmed().isEmpty()) {
                result.warnings << QStringLiteral("line %1: text without a declaration block is ignored")
                                       .arg(lineAt(source, pos));
            }
            break;
        }

        const int line = lineAt(source, open);
        const int close = QssText::indexOfTopLevel(source, QLatin1Char('}'), open + 1);
        if (close < 0) {
            result.warnings << QStringLiteral("line %1: unterminated declaration block, the rest of the text is ignored")
                                   .arg(line);
            break;
        }
        const int nested = QssText::indexOfTopLevel(source, QLatin1Char('{'), open + 1);
        if (nested >= 0 && nested < close) {
            result.warnings << QStringLiteral("line %1: nested block is ignored").arg(line);
            // Skip up to the brace closing the outer block
            const int outerClose = QssText::indexOfTopLevel(source, QLatin1Char('}'), close + 1);
            pos = outerClose < 0 ? source.size() : outerClose + 1;
            continue;
        }

        const QString selectorText = source.mid(pos, open - pos);
        const QString body = source.mid(open + 1, close - open - 1);
        pos = close + 1;

        const QStringList selectorTexts = QssText::splitTopLevel(selectorText, QLatin1Char(','));
        if (selectorTexts.isEmpty()) {
            result.warnings << QStringLiteral("line %1: declaration block without a selector is ignored").arg(line);
            continue;
        }

        QList<StyleSelector> selectors;
        for (const QString &candidate : selectorTexts) {
            StyleSelector selector;
            QString error;
            if (StyleSelector::parse(candidate, &selector, &error)) {
                selectors.append(selector);
            } else {
                result.warnings << QStringLiteral("line %1: %2").arg(line).arg(error);
            }
        }
        if (selectors.isEmpty()) continue;

        const PropertySet properties = parseDeclarations(body, line, &result.warnings);
        for (const StyleSelector &selector : selectors) {
            rules.append(StyleRule(selector, properties));
        }
    }

    result.table = StyleRuleTable(rules);
    return result;
}

bool QssParser::readFile(const QString &path, QString *text, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    QTextStream stream(&file);
    const QString content = stream.readAll();
    if (text) *text = content;
    return true;
}

bool QssParser::parseFile(const QString &path, Result *result, QString *errorMessage)
{
    QString text;
    if (!readFile(path, &text, errorMessage)) {
        qWarning() << "QssParser: Failed to read" << path;
        return false;
    }
    const Result parsed = parse(text);
    for (const QString &warning : parsed.warnings) {
        qWarning().noquote() << "QssParser:" << path << warning;
    }
    qDebug() << "QssParser: Parsed" << path << "-" << parsed.table.size() << "rules,"
             << parsed.warnings.size() << "warnings";
    if (result) *result = parsed;
    return true;
}
