#include "core/appconfig.h"
#include "theme/tabbartheme.h"

#include <QDebug>
#include <QDir>
#include <QStandardPaths>

namespace {
const char *kStyleSheetKey = "appearance/styleSheet";
const char *kTabPositionKey = "appearance/tabPosition";
const char *kValidateThemeKey = "appearance/validateTheme";
const char *kLogToFileKey = "debug/logToFile";
}

AppConfig& AppConfig::getInstance()
{
    static AppConfig instance;
    return instance;
}

AppConfig::AppConfig()
{
    const QString appData = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(appData);
    m_settings = std::make_unique<QSettings>(appData + "/settings.ini", QSettings::IniFormat);
    qDebug() << "AppConfig: Using settings file" << m_settings->fileName();
}

QString AppConfig::settingsFilePath() const
{
    return m_settings->fileName();
}

QString AppConfig::getStyleSheetPath() const
{
    if (!m_styleSheetOverride.isEmpty()) return m_styleSheetOverride;
    return m_settings->value(kStyleSheetKey, TabBarTheme::resourcePath()).toString();
}

void AppConfig::setStyleSheetPath(const QString &path)
{
    m_settings->setValue(kStyleSheetKey, path);
}

void AppConfig::setStyleSheetOverride(const QString &path)
{
    m_styleSheetOverride = path;
}

bool AppConfig::areTabsAtBottom() const
{
    return m_settings->value(kTabPositionKey, "top").toString().compare("bottom", Qt::CaseInsensitive) == 0;
}

void AppConfig::setTabsAtBottom(bool bottom)
{
    m_settings->setValue(kTabPositionKey, bottom ? "bottom" : "top");
}

bool AppConfig::isThemeValidationEnabled() const
{
    return m_settings->value(kValidateThemeKey, true).toBool();
}

void AppConfig::setThemeValidationEnabled(bool enabled)
{
    m_settings->setValue(kValidateThemeKey, enabled);
}

bool AppConfig::isFileLoggingEnabled() const
{
    return m_settings->value(kLogToFileKey, true).toBool();
}

void AppConfig::setFileLoggingEnabled(bool enabled)
{
    m_settings->setValue(kLogToFileKey, enabled);
}

void AppConfig::sync()
{
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qWarning() << "AppConfig: Failed to write" << m_settings->fileName();
    }
}

void AppConfig::resetToDefaults()
{
    m_settings->clear();
    m_styleSheetOverride.clear();
    sync();
}
