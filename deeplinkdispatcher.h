#pragma once

#include <QString>
#include <QStringList>
#include <stdexcept>

class CommandExecutor;

class AdbCommandError : public std::runtime_error {
public:
    explicit AdbCommandError(const QString &message)
        : std::runtime_error(message.toStdString()) {}
};

class DeeplinkDispatcher {
public:
    static constexpr int DispatchTimeoutMs = 30000;

    explicit DeeplinkDispatcher(CommandExecutor *executor);

    // Starts a VIEW intent for the deep-link. An empty serial leaves device
    // selection to adb. Throws AdbCommandError on any failure.
    void dispatch(const QString &deviceSerial, const QString &deeplink);

    static QStringList buildArguments(const QString &deviceSerial, const QString &deeplink);

private:
    CommandExecutor *m_executor;
};
