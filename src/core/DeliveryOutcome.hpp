#pragma once

#include <QJsonObject>
#include <QString>

namespace chime {

/// What happened to one notify request. Empty strings stand for "none".
struct DeliveryOutcome {
    QString message;
    bool soundDelivered = false;
    QString soundPathUsed;
    bool visualDelivered = false;
    QString methodUsed;

    /// Set when the pre-delivery hook answered; returned to callers verbatim.
    QJsonObject delegated;

    /// A partial win (sound only or banner only) still counts.
    bool success() const;

    /// {"status", "message", "sound", "visual"}; sound is null unless played.
    QJsonObject toJson() const;
};

} // namespace chime
