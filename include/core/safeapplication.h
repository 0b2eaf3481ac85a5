#ifndef SAFEAPPLICATION_H
#define SAFEAPPLICATION_H

#include <QApplication>

// QApplication that catches exceptions escaping Qt event dispatch, logs them
// and reports them to the user instead of terminating.
class SafeApplication : public QApplication {
public:
    using QApplication::QApplication;
    bool notify(QObject *receiver, QEvent *event) override;
};

// Common startup for the executables: application identity, logging,
// Fusion style and the --stylesheet command line option.
void initializeApplication(SafeApplication &app, const QString &displayName);

#endif // SAFEAPPLICATION_H
