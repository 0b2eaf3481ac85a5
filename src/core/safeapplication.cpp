#include "core/safeapplication.h"
#include "core/appconfig.h"
#include "core/applog.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QMessageBox>
#include <QStyleFactory>

#include <exception>

bool SafeApplication::notify(QObject *receiver, QEvent *event)
{
    try {
        return QApplication::notify(receiver, event);
    } catch (const std::exception &e) {
        AppLog::append("crash", QString("exception in Qt notify: %1").arg(e.what()));
        QMessageBox::critical(nullptr, "Runtime Error", QString("An error occurred and was handled: %1").arg(e.what()));
        return false;
    }
}

void initializeApplication(SafeApplication &app, const QString &displayName)
{
    app.setApplicationName("TabTheme");
    app.setApplicationDisplayName(displayName);
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("TabTheme");

    AppConfig &config = AppConfig::getInstance();
    AppLog::setFileLoggingEnabled(config.isFileLoggingEnabled());
    AppLog::install();
    AppLog::append("app", QString("startup %1").arg(displayName));

    QCommandLineParser parser;
    parser.setApplicationDescription(displayName);
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption styleSheetOption(QStringList() << "s" << "stylesheet",
                                              "Style sheet to load instead of the configured one.",
                                              "path");
    parser.addOption(styleSheetOption);
    parser.process(app);

    if (parser.isSet(styleSheetOption)) {
        config.setStyleSheetOverride(parser.value(styleSheetOption));
        AppLog::append("app", QString("style sheet override: %1").arg(parser.value(styleSheetOption)));
    }

    // Style sheets are drawn on top of Fusion on every platform
    app.setStyle(QStyleFactory::create("Fusion"));
}
