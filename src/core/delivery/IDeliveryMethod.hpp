#pragma once

#include <QString>

namespace chime {

/// One mechanism for showing a desktop banner. Each method checks its own
/// runtime dependency inside attempt() and reports false when unavailable.
/// Implementations may throw; VisualDeliverer treats that as a failed attempt.
class IDeliveryMethod {
public:
    virtual ~IDeliveryMethod() = default;

    virtual QString name() const = 0;

    /// iconPath may be empty.
    virtual bool attempt(const QString& title, const QString& message,
                         const QString& iconPath) = 0;
};

} // namespace chime
