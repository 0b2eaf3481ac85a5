// Tab bar style debugger: previews the theme on a live tab widget and shows
// which rules apply to a chosen tab state.

#include "core/applog.h"
#include "core/safeapplication.h"
#include "theme/thememanager.h"
#include "ui/styledebugger.h"

int main(int argc, char *argv[])
{
    SafeApplication app(argc, argv);
    initializeApplication(app, "Tab Bar Style Debugger");

    ThemeManager *theme = ThemeManager::instance();
    if (!theme->loadConfigured()) {
        AppLog::append("app", "configured style sheet unavailable, using the built-in theme");
    }
    theme->apply(&app);

    StyleDebugger debugger;
    debugger.show();

    const int rc = app.exec();
    AppLog::append("app", QString("shutdown rc=%1").arg(rc));
    AppLog::uninstall();
    return rc;
}
