#pragma once

#include "core/ResourceConfig.hpp"

namespace chime {

class ChimeConfig;

/// Maps environment overrides + static settings + filesystem state to the
/// sound and icon paths for a request. Reads the environment on every call,
/// so a long-running server picks up changes without a restart.
class ResourceResolver {
public:
    explicit ResourceResolver(const ChimeConfig& config);

    /// Snapshot of everything below, taken once per request.
    ResourceConfig resolve() const;

    /// Legacy override → kind-specific override → built-in default in the
    /// system sound directory. Overrides are used only if the file exists;
    /// the default is returned unchecked (SoundDeliverer checks at play time).
    QString resolveSound(NotificationKind kind) const;

    /// Env override → bundled icon → app default icon → empty.
    QString resolveIcon() const;

    bool visualEnabled() const;

private:
    QString legacySound() const;
    QString kindSound(NotificationKind kind) const;

    const ChimeConfig& config_;
};

} // namespace chime
