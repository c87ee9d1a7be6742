#pragma once

#include <QString>

namespace chime {

/// Semantic notification category. Selects the title and the sound role.
enum class NotificationKind {
    Start,    ///< assistant started working
    Complete  ///< assistant finished, response ready
};

/// "start" or "complete"; the positional argument passed to the helper script.
QString kindName(NotificationKind kind);

/// "start" or "completion"; used in log lines about sound selection.
QString soundRole(NotificationKind kind);

/// Classify a free-form status message. Any message containing "start" or
/// "processing" (case-insensitive) is Start; everything else is Complete.
/// Callers depend on this exact behavior, including its false positives.
NotificationKind classifyMessage(const QString& message);

} // namespace chime
