#include "core/ResourceConfig.hpp"
#include <QStringList>

namespace chime {

QString ResourceConfig::soundFor(NotificationKind kind) const
{
    if (!legacySoundPath.isEmpty())
        return legacySoundPath;
    return kind == NotificationKind::Start ? startSoundPath : completeSoundPath;
}

bool parseFlag(const QString& value, bool defaultValue)
{
    if (value.isNull())
        return defaultValue;

    static const QStringList truthy = {
        QStringLiteral("true"), QStringLiteral("1"), QStringLiteral("yes"),
        QStringLiteral("y"), QStringLiteral("on")
    };
    return truthy.contains(value.toLower());
}

} // namespace chime
