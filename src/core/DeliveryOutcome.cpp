#include "core/DeliveryOutcome.hpp"
#include <QJsonValue>

namespace chime {

bool DeliveryOutcome::success() const
{
    if (!delegated.isEmpty())
        return delegated.value(QStringLiteral("status")).toString() == QLatin1String("success");
    return soundDelivered || visualDelivered;
}

QJsonObject DeliveryOutcome::toJson() const
{
    if (!delegated.isEmpty())
        return delegated;

    QJsonObject obj;
    obj["status"] = success() ? QStringLiteral("success") : QStringLiteral("error");
    obj["message"] = message;
    obj["sound"] = soundDelivered ? QJsonValue(soundPathUsed) : QJsonValue(QJsonValue::Null);
    obj["visual"] = visualDelivered;
    return obj;
}

} // namespace chime
