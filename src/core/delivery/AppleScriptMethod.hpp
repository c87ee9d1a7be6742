#pragma once

#include "IDeliveryMethod.hpp"

namespace chime {

class IProcessRunner;

/// `osascript -e 'display notification ...'` through System Events.
class AppleScriptMethod : public IDeliveryMethod {
public:
    AppleScriptMethod(IProcessRunner& runner, int timeoutMs, int settleDelayMs);

    QString name() const override { return QStringLiteral("applescript"); }
    bool attempt(const QString& title, const QString& message,
                 const QString& iconPath) override;

    /// Script text handed to osascript; quotes and backslashes are escaped.
    static QString buildScript(const QString& title, const QString& message);

private:
    IProcessRunner& runner_;
    int timeoutMs_;
    int settleDelayMs_;
};

} // namespace chime
