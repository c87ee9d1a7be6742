#include "core/process/ProcessRunner.hpp"
#include <QProcess>
#include <QStandardPaths>
#include <boost/log/trivial.hpp>

namespace chime {

ProcessResult ProcessRunner::run(const QString& program, const QStringList& args, int timeoutMs)
{
    ProcessResult result;

    QProcess proc;
    proc.start(program, args);
    if (!proc.waitForStarted()) {
        result.errorString = proc.errorString();
        BOOST_LOG_TRIVIAL(debug) << "ProcessRunner: " << program.toStdString()
                                 << " failed to start: " << result.errorString.toStdString();
        return result;
    }
    result.started = true;

    if (!proc.waitForFinished(timeoutMs) && proc.state() != QProcess::NotRunning) {
        result.timedOut = true;
        result.errorString = QStringLiteral("timed out after %1 ms").arg(timeoutMs);
        proc.kill();
        proc.waitForFinished(1000);
        BOOST_LOG_TRIVIAL(warning) << "ProcessRunner: " << program.toStdString() << " "
                                   << result.errorString.toStdString();
        return result;
    }

    result.stdOut = proc.readAllStandardOutput();
    result.stdErr = proc.readAllStandardError();

    if (proc.exitStatus() == QProcess::CrashExit) {
        result.errorString = proc.errorString();
        return result;
    }

    result.exitCode = proc.exitCode();
    return result;
}

QString ProcessRunner::findExecutable(const QString& name) const
{
    return QStandardPaths::findExecutable(name);
}

} // namespace chime
