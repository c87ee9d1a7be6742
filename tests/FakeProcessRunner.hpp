#pragma once

#include "core/process/IProcessRunner.hpp"
#include <QHash>
#include <QList>
#include <functional>

/// Records every run() call; answers with `handler` or a clean exit.
class FakeProcessRunner : public chime::IProcessRunner {
public:
    struct Call {
        QString program;
        QStringList args;
        int timeoutMs;
    };

    QList<Call> calls;
    QHash<QString, QString> executables;  // name -> full path
    std::function<chime::ProcessResult(const Call&)> handler;

    chime::ProcessResult run(const QString& program, const QStringList& args,
                             int timeoutMs = NoTimeout) override
    {
        calls.append({program, args, timeoutMs});
        if (handler)
            return handler(calls.last());
        return exited(0);
    }

    QString findExecutable(const QString& name) const override
    {
        return executables.value(name);
    }

    static chime::ProcessResult exited(int code, const QByteArray& out = {})
    {
        chime::ProcessResult r;
        r.started = true;
        r.exitCode = code;
        r.stdOut = out;
        return r;
    }

    static chime::ProcessResult notStarted()
    {
        chime::ProcessResult r;
        r.errorString = QStringLiteral("No such file or directory");
        return r;
    }

    static chime::ProcessResult timedOut()
    {
        chime::ProcessResult r;
        r.started = true;
        r.timedOut = true;
        return r;
    }
};
