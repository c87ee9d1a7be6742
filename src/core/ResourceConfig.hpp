#pragma once

#include "core/NotificationKind.hpp"
#include <QString>

namespace chime {

// Environment variables recognized on every request.
namespace env {
constexpr const char* StartSound = "CLAUDE_START_SOUND";
constexpr const char* CompleteSound = "CLAUDE_COMPLETE_SOUND";
constexpr const char* LegacySound = "CLAUDE_NOTIFICATION_SOUND";
constexpr const char* VisualNotifications = "CLAUDE_VISUAL_NOTIFICATIONS";
constexpr const char* NotificationIcon = "CLAUDE_NOTIFICATION_ICON";
} // namespace env

/// Resources chosen for one request. Built fresh by ResourceResolver::resolve()
/// and passed by value through the pipeline; empty strings mean "none".
struct ResourceConfig {
    QString startSoundPath;
    QString completeSoundPath;
    QString legacySoundPath;
    QString iconPath;
    bool visualNotificationsEnabled = true;

    /// Legacy override wins for both kinds.
    QString soundFor(NotificationKind kind) const;
};

/// Truthy tokens are true, 1, yes, y, on (any case); anything else is false.
/// A null value (variable unset) yields defaultValue.
bool parseFlag(const QString& value, bool defaultValue = true);

} // namespace chime
