#include "applog.h"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QtGlobal>
#include <cstdio>

namespace {

QString g_logFilePath;
QtMessageHandler g_previousHandler = nullptr;

const char *levelName(QtMsgType type) {
    switch (type) {
    case QtDebugMsg: return "DEBUG";
    case QtInfoMsg: return "INFO";
    case QtWarningMsg: return "WARNING";
    case QtCriticalMsg: return "CRITICAL";
    case QtFatalMsg: return "FATAL";}
    return "UNKNOWN";}

void fileMessageHandler(QtMsgType type, const QMessageLogContext &, const QString &msg) {
    const QString line = QString("%1 - %2 - %3")
        .arg(QDateTime::currentDateTime().toString(Qt::ISODate), QString::fromLatin1(levelName(type)), msg);
    fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
    fflush(stderr);
    if (type == QtDebugMsg || g_logFilePath.isEmpty()) return;
    QFile f(g_logFilePath);
    if (f.open(QIODevice::Append | QIODevice::Text)) {
        QTextStream out(&f);
        out << line << "\n";
        f.close();}}

} // namespace

void installFileLogger(const QString &logFilePath) {
    const QString dir = QFileInfo(logFilePath).absolutePath();
    if (!QDir().mkpath(dir)) {
        fprintf(stderr, "Cannot create log directory %s\n", dir.toLocal8Bit().constData());
        g_logFilePath.clear();
    } else {
        g_logFilePath = logFilePath;}
    QtMessageHandler previous = qInstallMessageHandler(fileMessageHandler);
    if (previous != fileMessageHandler) g_previousHandler = previous;}

void uninstallFileLogger() {
    qInstallMessageHandler(g_previousHandler);
    g_previousHandler = nullptr;
    g_logFilePath.clear();}

QString currentLogFilePath() {
    return g_logFilePath;}
