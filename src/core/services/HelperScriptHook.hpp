#pragma once

#include "IDeliveryHook.hpp"

namespace chime {

class IProcessRunner;

/// Runs an external helper script as `script <title> <message> <start|complete>`.
/// Its stdout is trusted only on exit code 0 and only if it is a single
/// JSON object. Any other result is "no opinion".
class HelperScriptHook : public IDeliveryHook {
public:
    HelperScriptHook(IProcessRunner& runner, const QString& scriptPath, int timeoutMs);

    std::optional<QJsonObject> tryDeliver(NotificationKind kind, const QString& title,
                                          const QString& message) override;

    QString scriptPath() const { return scriptPath_; }

private:
    IProcessRunner& runner_;
    QString scriptPath_;
    int timeoutMs_;
};

} // namespace chime
