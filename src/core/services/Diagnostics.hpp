#pragma once

#include <QString>
#include <QStringList>

namespace chime {

class ChimeConfig;
class ResourceResolver;
class IProcessRunner;
class IVisualDeliverer;

/// Startup self-checks, run by `task-chime check` and before `serve`.
class Diagnostics {
public:
    Diagnostics(const ChimeConfig& config, const ResourceResolver& resolver,
                IProcessRunner& runner, IVisualDeliverer& visual);

    /// Both resolved sound files exist. Missing paths are appended to missing.
    bool verifySounds(QStringList* missing = nullptr) const;

    /// Visual mechanisms usable on this host, in delivery order.
    QStringList availableMechanisms() const;

    /// Sends a test banner through the full chain so the OS shows its
    /// permission prompt; retries once with osascript directly on failure.
    /// Returns true without sending anything if visual notifications are off.
    bool verifyVisual();

    /// *.aiff file names in dir, sorted; empty if unreadable.
    static QStringList listSystemSounds(const QString& dir);

private:
    const ChimeConfig& config_;
    const ResourceResolver& resolver_;
    IProcessRunner& runner_;
    IVisualDeliverer& visual_;
};

} // namespace chime
