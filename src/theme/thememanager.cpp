#include "theme/thememanager.h"
#include "theme/qssparser.h"
#include "theme/tabbartheme.h"
#include "core/appconfig.h"

#include <QApplication>
#include <QDebug>

ThemeManager* ThemeManager::s_instance = nullptr;

ThemeManager* ThemeManager::instance()
{
    if (!s_instance) {
        if (!qApp) {
            qWarning() << "ThemeManager: Created before the application object, it will not be deleted";
        }
        s_instance = new ThemeManager(qApp);
        connect(s_instance, &QObject::destroyed, []() { s_instance = nullptr; });
    }
    return s_instance;
}

ThemeManager::ThemeManager(QObject *parent)
    : QObject(parent)
{
    // Usable before anything is loaded
    const StyleRuleTable builtIn = TabBarTheme::defaultTable();
    m_table = builtIn;
    m_styleSheet = builtIn.toStyleSheet();
}

void ThemeManager::install(const StyleRuleTable &table, const QString &styleSheet, const QString &sourcePath,
                           const QStringList &warnings)
{
    m_table = table;
    m_styleSheet = styleSheet;
    m_sourcePath = sourcePath;
    m_parseWarnings = warnings;
    m_issues.clear();

    const QString source = sourcePath.isEmpty() ? QStringLiteral("<built-in>") : sourcePath;
    if (m_validationEnabled) {
        m_issues = ThemeValidator::validate(m_table);
        for (const ThemeIssue &issue : m_issues) {
            qWarning().noquote() << "ThemeManager:" << source << issue.toString();
        }
    }
    qInfo() << "ThemeManager: Loaded theme" << source << "-" << m_table.size() << "rules,"
            << m_parseWarnings.size() << "parse warnings," << m_issues.size() << "issues";
}

bool ThemeManager::load(const QString &path, QString *errorMessage)
{
    QString text;
    QString error;
    if (!QssParser::readFile(path, &text, &error)) {
        qWarning().noquote() << "ThemeManager: Keeping current theme," << error;
        if (errorMessage) *errorMessage = error;
        return false;
    }

    const QssParser::Result parsed = QssParser::parse(text);
    for (const QString &warning : parsed.warnings) {
        qWarning().noquote() << "ThemeManager:" << path << warning;
    }
    if (parsed.table.isEmpty()) {
        qWarning() << "ThemeManager:" << path << "has no tab bar rules";
    }
    // The toolkit gets the file as written; the table only covers the tab bar rules
    install(parsed.table, text, path, parsed.warnings);
    return true;
}

void ThemeManager::loadBuiltIn()
{
    const StyleRuleTable builtIn = TabBarTheme::defaultTable();
    install(builtIn, builtIn.toStyleSheet(), QString(), QStringList());
}

bool ThemeManager::loadConfigured()
{
    AppConfig &config = AppConfig::getInstance();
    m_validationEnabled = config.isThemeValidationEnabled();

    const QString path = config.getStyleSheetPath();
    QString error;
    if (!path.isEmpty() && load(path, &error)) {
        return true;
    }
    qWarning().noquote() << "ThemeManager: Falling back to the built-in theme"
                         << (error.isEmpty() ? QString() : QStringLiteral("(%1)").arg(error));
    loadBuiltIn();
    return false;
}

void ThemeManager::apply(QApplication *app)
{
    if (!app) return;
    app->setStyleSheet(m_styleSheet);
    qDebug() << "ThemeManager: Applied style sheet," << m_styleSheet.length() << "characters";
    emit themeChanged();
}
