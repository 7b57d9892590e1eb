#pragma once

#include <QObject>
#include <QProcess>
#include <QStringList>

struct CommandResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    QProcess::ExitStatus exitStatus = QProcess::NormalExit;
    QString stdOut;
    QString stdErr;
    QString errorString;

    bool succeeded() const {
        return started && !timedOut && exitStatus == QProcess::NormalExit && exitCode == 0; }
};

// Runs adb to completion on the calling thread. Subclassed in tests.
class CommandExecutor : public QObject {
    Q_OBJECT
public:
    static constexpr int NoTimeout = -1;

    explicit CommandExecutor(QObject *parent = nullptr);
    ~CommandExecutor() override;

    virtual CommandResult runAdbCommand(const QStringList &args, int timeoutMs = NoTimeout);
    CommandResult runDeviceCommand(const QString &serial, const QStringList &args, int timeoutMs = NoTimeout);

    void setAdbPath(const QString &path);
    QString adbPath() const { return m_adbPath; }
    bool hasAdb() const { return !m_adbPath.isEmpty(); }

    static QString resolveAdbPath(const QString &preferred = QString());

signals:
    void commandStarted(const QString &commandLine);
    void outputReceived(const QString &text);
    void errorReceived(const QString &text);
    void finished(int exitCode, QProcess::ExitStatus exitStatus);

private:
    QString m_adbPath;
};
