#include "core/applog.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>

#include <atomic>
#include <cstdio>

namespace {
QMutex g_logMutex;
QString g_logPath;
std::atomic<bool> g_fileLogging{true};
QtMessageHandler g_previousHandler = nullptr;
}

QString AppLog::logFilePath()
{
    QMutexLocker locker(&g_logMutex);
    if (!g_logPath.isEmpty()) return g_logPath;
    return QCoreApplication::applicationDirPath() + "/tabtheme.log";
}

void AppLog::setFileLoggingEnabled(bool enabled)
{
    g_fileLogging.store(enabled);
}

bool AppLog::isFileLoggingEnabled()
{
    return g_fileLogging.load();
}

const char *AppLog::levelName(QtMsgType type)
{
    switch (type) {
        case QtDebugMsg: return "DEBUG";
        case QtInfoMsg: return "INFO";
        case QtWarningMsg: return "WARN";
        case QtCriticalMsg: return "CRIT";
        case QtFatalMsg: return "FATAL";
    }
    return "INFO";
}

void AppLog::append(const QString &tag, const QString &message)
{
    const QString line = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz")
                         + " [" + tag + "] " + message;

    std::fprintf(stderr, "%s\n", qPrintable(line));

    if (!isFileLoggingEnabled()) return;
    const QString path = logFilePath();
    QMutexLocker locker(&g_logMutex);
    QFile f(path);
    if (f.open(QIODevice::Append | QIODevice::Text)) {
        QTextStream ts(&f);
        ts << line << '\n';
        ts.flush();
    }
}

void AppLog::messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    QString ctxStr;
    if (context.file && context.function) {
        ctxStr = QString(" (%1:%2 %3)").arg(context.file).arg(context.line).arg(context.function);
    }
    append("qt", QString("%1: %2%3").arg(QLatin1String(levelName(type)), message, ctxStr));
}

void AppLog::install(const QString &filePath)
{
    {
        QMutexLocker locker(&g_logMutex);
        g_logPath = filePath;
    }
    g_previousHandler = qInstallMessageHandler(&AppLog::messageHandler);
}

void AppLog::uninstall()
{
    qInstallMessageHandler(g_previousHandler);
    g_previousHandler = nullptr;
}
