#ifndef QSSPARSER_H
#define QSSPARSER_H

#include "theme/styleruletable.h"

#include <QString>
#include <QStringList>

// Reads the tab bar rules out of Qt style sheet text.
// Like the Qt style engine, anything it cannot use is skipped rather than
// rejected; each skipped piece is reported in warnings.
class QssParser {
public:
    struct Result {
        StyleRuleTable table;
        QStringList warnings;
    };

    static Result parse(const QString &text);

    // Reads path with QFile (":/..." resource paths included) and parses it.
    // Returns false, and leaves result untouched, when the file cannot be read.
    static bool parseFile(const QString &path, Result *result, QString *errorMessage = nullptr);

    // Reads the raw text of a style sheet file
    static bool readFile(const QString &path, QString *text, QString *errorMessage = nullptr);
};

#endif // QSSPARSER_H
