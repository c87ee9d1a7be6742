#pragma once

#include "core/DeliveryOutcome.hpp"
#include "core/NotificationKind.hpp"

namespace chime {

class ChimeConfig;
class ResourceResolver;
class ISoundDeliverer;
class IVisualDeliverer;
class IDeliveryHook;

/// Turns one start/complete event into a sound plus a banner.
///
/// Sequence per request: consult the hook (if any); otherwise resolve
/// resources once, play the sound, and, when visual notifications are
/// enabled, send the banner. Never throws; every failure ends up as
/// "not delivered" in the returned outcome.
class NotificationCoordinator {
public:
    NotificationCoordinator(const ChimeConfig& config, const ResourceResolver& resolver,
                            ISoundDeliverer& sound, IVisualDeliverer& visual);

    /// Hook is optional and not owned. Pass nullptr to disable.
    void setHook(IDeliveryHook* hook) { hook_ = hook; }

    DeliveryOutcome notify(NotificationKind kind, const QString& message);

    /// Entry point used by the process boundary: classifies the message
    /// text, then behaves like notify().
    DeliveryOutcome notifyMessage(const QString& message);

    QString titleFor(NotificationKind kind) const;

private:
    const ChimeConfig& config_;
    const ResourceResolver& resolver_;
    ISoundDeliverer& sound_;
    IVisualDeliverer& visual_;
    IDeliveryHook* hook_ = nullptr;
};

} // namespace chime
