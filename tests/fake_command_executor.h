#pragma once

#include "commandexecutor.h"
#include <QList>
#include <QMap>
#include <QStringList>

// Records every adb invocation and answers from a table keyed by the
// space-joined argument list. Unknown commands fail to start.
class FakeCommandExecutor : public CommandExecutor {
public:
    struct Call {
        QStringList args;
        int timeoutMs;
    };

    void respond(const QStringList &args, const CommandResult &result) {
        m_responses.insert(args.join(' '), result);}

    static CommandResult ok(const QString &out = QString()) {
        CommandResult r;
        r.started = true;
        r.exitCode = 0;
        r.stdOut = out;
        return r;}

    static CommandResult failed(int exitCode, const QString &err = QString()) {
        CommandResult r;
        r.started = true;
        r.exitCode = exitCode;
        r.stdErr = err;
        return r;}

    static CommandResult timedOut() {
        CommandResult r;
        r.started = true;
        r.timedOut = true;
        r.errorString = "timed out";
        return r;}

    CommandResult runAdbCommand(const QStringList &args, int timeoutMs) override {
        calls.append(Call{args, timeoutMs});
        const auto it = m_responses.constFind(args.join(' '));
        if (it != m_responses.constEnd()) return it.value();
        CommandResult r;
        r.errorString = "not scripted";
        return r;}

    QList<Call> calls;

private:
    QMap<QString, CommandResult> m_responses;
};
