#include "NotificationCenterMethod.hpp"
#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDBusInterface>
#include <QDBusReply>
#include <QStringList>
#include <QUrl>
#include <QVariantMap>
#include <boost/log/trivial.hpp>

namespace chime {

static const QString NOTIFY_SERVICE = QStringLiteral("org.freedesktop.Notifications");
static const QString NOTIFY_PATH = QStringLiteral("/org/freedesktop/Notifications");
static const QString NOTIFY_INTERFACE = QStringLiteral("org.freedesktop.Notifications");

NotificationCenterMethod::NotificationCenterMethod(int timeoutMs, const QString& appName)
    : timeoutMs_(timeoutMs)
    , appName_(appName)
{
}

bool NotificationCenterMethod::isServiceAvailable()
{
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected() || !bus.interface())
        return false;
    QDBusReply<bool> registered = bus.interface()->isServiceRegistered(NOTIFY_SERVICE);
    return registered.isValid() && registered.value();
}

bool NotificationCenterMethod::attempt(const QString& title, const QString& message,
                                       const QString& iconPath)
{
    if (!isServiceAvailable()) {
        BOOST_LOG_TRIVIAL(info) << "NotificationCenterMethod: notification service not available";
        return false;
    }

    QDBusInterface notifications(NOTIFY_SERVICE, NOTIFY_PATH, NOTIFY_INTERFACE,
                                 QDBusConnection::sessionBus());
    notifications.setTimeout(timeoutMs_);

    QVariantMap hints;
    if (!iconPath.isEmpty())
        hints.insert(QStringLiteral("image-path"), QUrl::fromLocalFile(iconPath).toString());

    // Notify(app_name, replaces_id, app_icon, summary, body, actions, hints, expire_timeout)
    QDBusReply<uint> reply = notifications.call(QStringLiteral("Notify"),
                                                appName_, 0u, iconPath, title, message,
                                                QStringList(), hints, -1);
    if (!reply.isValid()) {
        BOOST_LOG_TRIVIAL(warning) << "NotificationCenterMethod: Notify failed: "
                                   << reply.error().message().toStdString();
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "NotificationCenterMethod: posted notification id " << reply.value();
    return true;
}

} // namespace chime
