#include "theme/themevalidator.h"

#include <QFileInfo>
#include <QImageReader>
#include <QSvgRenderer>

QString ThemeIssue::toString() const
{
    return QStringLiteral("%1 { %2 }: %3").arg(selector, property, message);
}

bool ThemeValidator::isReadableImage(const QString &path)
{
    QImageReader reader(path);
    if (reader.canRead()) return true;
    // Without the svg image format plugin QImageReader cannot tell
    QSvgRenderer renderer(path);
    return renderer.isValid();
}

bool ThemeValidator::assetExists(const QString &path)
{
    if (path.isEmpty()) return false;
    const QFileInfo info(path);
    return info.exists() && info.isFile();
}

QList<ThemeIssue> ThemeValidator::validate(const StyleRuleTable &table)
{
    QList<ThemeIssue> issues;
    for (const StyleRule &rule : table.rules()) {
        const QString selector = rule.selector.toString();
        for (const QString &name : rule.properties.names()) {
            const PropertyValue value = rule.properties.value(name);
            ThemeIssue issue;
            issue.selector = selector;
            issue.property = name;

            switch (value.kind()) {
            case PropertyValue::Url:
                if (!assetExists(value.toUrl())) {
                    issue.message = QStringLiteral("asset %1 does not exist").arg(value.toUrl());
                    issues.append(issue);
                } else if (name == QLatin1String("image") && !isReadableImage(value.toUrl())) {
                    issue.message = QStringLiteral("asset %1 is not a readable image").arg(value.toUrl());
                    issues.append(issue);
                }
                break;
            case PropertyValue::Gradient: {
                QString reason;
                if (!value.toGradient().isValid(&reason)) {
                    issue.message = reason;
                    issues.append(issue);
                }
                break;
            }
            case PropertyValue::Color:
                if (!value.toColor().isValid()) {
                    issue.message = QStringLiteral("%1 is not a valid color").arg(value.toString());
                    issues.append(issue);
                }
                break;
            case PropertyValue::Invalid:
                issue.message = QStringLiteral("property has no value");
                issues.append(issue);
                break;
            case PropertyValue::Length:
            case PropertyValue::Text:
                break;
            }
        }
    }
    return issues;
}
