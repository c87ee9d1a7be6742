#pragma once

#include "core/process/IProcessRunner.hpp"

namespace chime {

/// QProcess-backed runner used in production.
class ProcessRunner : public IProcessRunner {
public:
    ProcessResult run(const QString& program, const QStringList& args,
                      int timeoutMs = NoTimeout) override;
    QString findExecutable(const QString& name) const override;
};

} // namespace chime
