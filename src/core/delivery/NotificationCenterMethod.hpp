#pragma once

#include "IDeliveryMethod.hpp"
#include "core/Version.hpp"

namespace chime {

/// Desktop notification service binding (org.freedesktop.Notifications on
/// the session bus). Skipped when no bus or no notification service is
/// registered; that is "unavailable", not an error.
class NotificationCenterMethod : public IDeliveryMethod {
public:
    explicit NotificationCenterMethod(int timeoutMs,
                                      const QString& appName = QString::fromLatin1(APP_NAME));

    QString name() const override { return QStringLiteral("notification-center"); }
    bool attempt(const QString& title, const QString& message,
                 const QString& iconPath) override;

    static bool isServiceAvailable();

private:
    int timeoutMs_;
    QString appName_;
};

} // namespace chime
