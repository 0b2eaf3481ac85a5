#ifndef THEMEVALIDATOR_H
#define THEMEVALIDATOR_H

#include "theme/styleruletable.h"

#include <QList>
#include <QString>

struct ThemeIssue {
    QString selector;
    QString property;
    QString message;

    QString toString() const;
};

// Static checks on a rule table: referenced assets exist (and images load),
// gradients are well formed, color literals are colors.
class ThemeValidator {
public:
    static QList<ThemeIssue> validate(const StyleRuleTable &table);

    // True when path names an existing file or Qt resource (":/...")
    static bool assetExists(const QString &path);
    static bool isReadableImage(const QString &path);
};

#endif // THEMEVALIDATOR_H
