#pragma once

#include "IDeliveryMethod.hpp"
#include <QStringList>

namespace chime {

class IProcessRunner;

/// Last resort: the notify-send CLI, only when it is on PATH.
class NotifySendMethod : public IDeliveryMethod {
public:
    NotifySendMethod(IProcessRunner& runner, int timeoutMs, int expireMs);

    QString name() const override { return QStringLiteral("notify-send"); }
    bool attempt(const QString& title, const QString& message,
                 const QString& iconPath) override;

    QStringList buildArguments(const QString& title, const QString& message,
                               const QString& iconPath) const;

private:
    IProcessRunner& runner_;
    int timeoutMs_;
    int expireMs_;
};

} // namespace chime
