#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace chime {

/// Result of one synchronous child process run.
struct ProcessResult {
    bool started = false;   ///< false: executable missing or not runnable
    bool timedOut = false;  ///< killed after exceeding the wait bound
    int exitCode = -1;
    QByteArray stdOut;
    QByteArray stdErr;
    QString errorString;

    bool succeeded() const { return started && !timedOut && exitCode == 0; }
};

/// Seam between the delivery pipeline and the OS. Every subprocess the
/// pipeline launches goes through here so tests can substitute a fake.
class IProcessRunner {
public:
    static constexpr int NoTimeout = -1;

    virtual ~IProcessRunner() = default;

    /// Run program with args, capture output, block until it exits or
    /// timeoutMs elapses (NoTimeout waits indefinitely). Never throws.
    virtual ProcessResult run(const QString& program, const QStringList& args,
                              int timeoutMs = NoTimeout) = 0;

    /// Full path of an executable on PATH, or empty if not found.
    virtual QString findExecutable(const QString& name) const = 0;
};

} // namespace chime
