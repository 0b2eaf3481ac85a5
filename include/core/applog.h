#ifndef APPLOG_H
#define APPLOG_H

#include <QString>
#include <QtGlobal>

// File logging for the executables. Every Qt message (qDebug, qWarning, ...)
// is appended to a log file next to the executable and echoed to stderr.
class AppLog {
public:
    // Installs the Qt message handler. An empty path selects logFilePath().
    static void install(const QString &filePath = QString());
    static void uninstall();

    static void append(const QString &tag, const QString &message);

    static QString logFilePath();
    static void setFileLoggingEnabled(bool enabled);
    static bool isFileLoggingEnabled();

    static const char *levelName(QtMsgType type);

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message);
};

#endif // APPLOG_H
