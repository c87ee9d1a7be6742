#pragma once

#include "core/NotificationKind.hpp"
#include <QJsonObject>
#include <QString>
#include <optional>

namespace chime {

/// Optional site-specific collaborator consulted before the built-in
/// pipeline. Returning an outcome short-circuits the pipeline; returning
/// nullopt ("no opinion") lets it run. Must not throw.
class IDeliveryHook {
public:
    virtual ~IDeliveryHook() = default;

    virtual std::optional<QJsonObject> tryDeliver(NotificationKind kind, const QString& title,
                                                  const QString& message) = 0;
};

} // namespace chime
