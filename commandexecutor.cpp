#include "commandexecutor.h"
#include <QByteArray>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

namespace {

bool isExecutableFile(const QString &path) {
    QFileInfo info(path);
    return info.exists() && info.isFile() && info.isExecutable();}

QStringList wellKnownAdbLocations() {
    QStringList candidates;
#ifdef Q_OS_WIN
    const QString localAppData = qEnvironmentVariable("LOCALAPPDATA");
    if (!localAppData.isEmpty())
        candidates << QDir(localAppData).filePath("Android/Sdk/platform-tools/adb.exe");
    const QString programFiles = qEnvironmentVariable("ProgramFiles");
    if (!programFiles.isEmpty())
        candidates << QDir(programFiles).filePath("Android/platform-tools/adb.exe");
#else
    candidates << "/opt/homebrew/bin/adb"   // macOS Apple Silicon
               << "/usr/local/bin/adb"
               << "/usr/bin/adb"
               << "/bin/adb";
#endif
    return candidates;}

} // namespace

CommandExecutor::CommandExecutor(QObject *parent) : QObject(parent) {
    m_adbPath = resolveAdbPath();}

CommandExecutor::~CommandExecutor() = default;

void CommandExecutor::setAdbPath(const QString &path) {
    const QString resolved = resolveAdbPath(path);
    if (resolved.isEmpty() && !path.isEmpty()) {
        qWarning() << "adb not found at" << path << "- keeping" << m_adbPath;
        return;}
    m_adbPath = resolved;}

QString CommandExecutor::resolveAdbPath(const QString &preferred) {
    if (!preferred.isEmpty()) {
        if (isExecutableFile(preferred)) return QFileInfo(preferred).absoluteFilePath();
        const QString found = QStandardPaths::findExecutable(preferred);
        return found;}
    const QString onPath = QStandardPaths::findExecutable("adb");
    if (!onPath.isEmpty()) return onPath;
    for (const QString &candidate : wellKnownAdbLocations()) {
        if (isExecutableFile(candidate)) return candidate;}
    return QString();}

CommandResult CommandExecutor::runDeviceCommand(const QString &serial, const QStringList &args, int timeoutMs) {
    QStringList finalArgs;
    if (!serial.isEmpty()) {
        finalArgs << "-s" << serial;}
    finalArgs.append(args);
    return runAdbCommand(finalArgs, timeoutMs);}

CommandResult CommandExecutor::runAdbCommand(const QStringList &args, int timeoutMs) {
    CommandResult result;
    if (m_adbPath.isEmpty()) {
        result.errorString = tr("adb executable not found");
        qWarning() << "Cannot run adb" << args << ":" << result.errorString;
        emit errorReceived(result.errorString);
        return result;}
    QString commandLine = QFileInfo(m_adbPath).fileName();
    if (!args.isEmpty()) commandLine.append(' ').append(args.join(' '));
    emit commandStarted(commandLine);
    qDebug() << "Running" << m_adbPath << args;

    QProcess process;
    process.start(m_adbPath, args);
    if (!process.waitForStarted(5000)) {
        result.errorString = process.errorString();
        qCritical() << "Failed to start adb:" << result.errorString;
        emit errorReceived(result.errorString);
        return result;}
    result.started = true;
    if (!process.waitForFinished(timeoutMs)) {
        result.timedOut = true;
        result.errorString = tr("adb did not finish within %1 ms").arg(timeoutMs);
        process.kill();
        process.waitForFinished(500);
        qWarning() << commandLine << "timed out after" << timeoutMs << "ms";
        emit errorReceived(result.errorString);
        return result;}
    result.exitCode = process.exitCode();
    result.exitStatus = process.exitStatus();
    result.stdOut = QString::fromUtf8(process.readAllStandardOutput());
    result.stdErr = QString::fromUtf8(process.readAllStandardError());
    if (result.exitStatus == QProcess::CrashExit) {
        result.errorString = process.errorString();}
    if (!result.stdOut.isEmpty()) emit outputReceived(result.stdOut);
    if (!result.stdErr.isEmpty()) emit errorReceived(result.stdErr);
    emit finished(result.exitCode, result.exitStatus);
    return result;}
