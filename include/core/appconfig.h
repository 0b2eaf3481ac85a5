#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QSettings>
#include <QString>

#include <memory>

// Application settings, stored as settings.ini under the application data location.
class AppConfig {
public:
    static AppConfig& getInstance();

    // Appearance
    QString getStyleSheetPath() const;          // configured path, or the one-run override
    void setStyleSheetPath(const QString &path);
    void setStyleSheetOverride(const QString &path); // --stylesheet, not persisted
    bool hasStyleSheetOverride() const { return !m_styleSheetOverride.isEmpty(); }

    bool areTabsAtBottom() const;
    void setTabsAtBottom(bool bottom);

    bool isThemeValidationEnabled() const;
    void setThemeValidationEnabled(bool enabled);

    // Debug
    bool isFileLoggingEnabled() const;
    void setFileLoggingEnabled(bool enabled);

    QString settingsFilePath() const;
    void sync();
    // Drops every stored value and the command line override
    void resetToDefaults();

private:
    AppConfig();
    AppConfig(const AppConfig&) = delete;
    AppConfig& operator=(const AppConfig&) = delete;

    std::unique_ptr<QSettings> m_settings;
    QString m_styleSheetOverride;
};

#endif // APPCONFIG_H
