#include "deeplinkdispatcher.h"
#include "commandexecutor.h"
#include <QDebug>

DeeplinkDispatcher::DeeplinkDispatcher(CommandExecutor *executor) : m_executor(executor) {}

QStringList DeeplinkDispatcher::buildArguments(const QString &deviceSerial, const QString &deeplink) {
    QStringList args;
    if (!deviceSerial.isEmpty()) {
        args << "-s" << deviceSerial;}
    args << "shell" << "am" << "start" << "-a" << "android.intent.action.VIEW" << "-d" << deeplink;
    return args;}

void DeeplinkDispatcher::dispatch(const QString &deviceSerial, const QString &deeplink) {
    if (!m_executor) {
        throw AdbCommandError(QStringLiteral("adb executable not found"));}
    const CommandResult result = m_executor->runAdbCommand(buildArguments(deviceSerial, deeplink), DispatchTimeoutMs);
    if (result.succeeded()) {
        qInfo() << "Dispatched" << deeplink << "to" << (deviceSerial.isEmpty() ? QStringLiteral("default device") : deviceSerial);
        return;}
    QString message;
    if (!result.started || result.timedOut || result.exitStatus == QProcess::CrashExit) {
        message = result.errorString;
    } else {
        const QString details = result.stdErr.trimmed().isEmpty() ? result.stdOut.trimmed() : result.stdErr.trimmed();
        message = QString("adb exited with code %1").arg(result.exitCode);
        if (!details.isEmpty()) message += QString(":\n%1").arg(details);}
    qCritical() << "Dispatch of" << deeplink << "failed:" << message;
    throw AdbCommandError(message);}
