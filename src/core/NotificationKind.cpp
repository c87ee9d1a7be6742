#include "core/NotificationKind.hpp"

namespace chime {

QString kindName(NotificationKind kind)
{
    return kind == NotificationKind::Start ? QStringLiteral("start") : QStringLiteral("complete");
}

QString soundRole(NotificationKind kind)
{
    return kind == NotificationKind::Start ? QStringLiteral("start") : QStringLiteral("completion");
}

NotificationKind classifyMessage(const QString& message)
{
    if (message.contains(QLatin1String("start"), Qt::CaseInsensitive)
        || message.contains(QLatin1String("processing"), Qt::CaseInsensitive))
        return NotificationKind::Start;
    return NotificationKind::Complete;
}

} // namespace chime
