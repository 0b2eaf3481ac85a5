#ifndef THEMEMANAGER_H
#define THEMEMANAGER_H

#include "theme/styleruletable.h"
#include "theme/themevalidator.h"

#include <QObject>
#include <QString>
#include <QStringList>

class QApplication;

// Process-wide owner of the tab bar theme. Lives on the UI thread.
// A loaded table is never modified; loading another resource replaces it wholesale.
class ThemeManager : public QObject {
    Q_OBJECT

public:
    static ThemeManager* instance();

    // Reads, parses and (optionally) validates a style sheet. On failure the
    // current theme is kept and false is returned.
    bool load(const QString &path, QString *errorMessage = nullptr);
    // Uses TabBarTheme::defaultTable()
    void loadBuiltIn();
    // Loads AppConfig's style sheet, falling back to the built-in theme
    bool loadConfigured();

    // Installs the style sheet text on the application and notifies widgets
    void apply(QApplication *app);

    const StyleRuleTable &table() const { return m_table; }
    PropertySet resolve(const WidgetState &state) const { return m_table.resolve(state); }

    QString styleSheet() const { return m_styleSheet; }
    QString sourcePath() const { return m_sourcePath; }
    bool isBuiltIn() const { return m_sourcePath.isEmpty(); }
    QStringList parseWarnings() const { return m_parseWarnings; }
    QList<ThemeIssue> issues() const { return m_issues; }

    void setValidationEnabled(bool enabled) { m_validationEnabled = enabled; }
    bool isValidationEnabled() const { return m_validationEnabled; }

signals:
    void themeChanged();

private:
    explicit ThemeManager(QObject *parent = nullptr);
    ThemeManager(const ThemeManager&) = delete;
    ThemeManager& operator=(const ThemeManager&) = delete;

    void install(const StyleRuleTable &table, const QString &styleSheet, const QString &sourcePath,
                 const QStringList &warnings);

    static ThemeManager* s_instance;

    StyleRuleTable m_table;
    QString m_styleSheet;
    QString m_sourcePath;
    QStringList m_parseWarnings;
    QList<ThemeIssue> m_issues;
    bool m_validationEnabled = true;
};

#endif // THEMEMANAGER_H
