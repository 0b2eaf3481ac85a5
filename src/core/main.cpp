#include "core/applog.h"
#include "core/safeapplication.h"
#include "theme/thememanager.h"
#include "ui/mainwindow.h"

#include <QMessageBox>

#include <exception>

int main(int argc, char *argv[])
{
    SafeApplication app(argc, argv);
    initializeApplication(app, "Graphol Editor");

    // Theme is loaded once, before any widget is shown
    ThemeManager *theme = ThemeManager::instance();
    if (!theme->loadConfigured()) {
        AppLog::append("app", "configured style sheet unavailable, using the built-in theme");
    }
    theme->apply(&app);

    int rc = 0;
    try {
        MainWindow window;
        window.show();
        AppLog::append("app", "main window shown");
        rc = app.exec();
    } catch (const std::exception &e) {
        AppLog::append("crash", QString("uncaught exception: %1").arg(e.what()));
        QMessageBox::critical(nullptr, "Unexpected Error", QString("An unexpected error occurred: %1").arg(e.what()));
        rc = 1;
    }
    AppLog::append("app", QString("shutdown rc=%1").arg(rc));
    AppLog::uninstall();
    return rc;
}
