#pragma once

#include <QString>
#include <yaml-cpp/yaml.h>

namespace chime {

/// Static settings read once at startup from config.yaml.
/// Environment overrides (CLAUDE_*) are applied later, per request,
/// by ResourceResolver and never stored here.
class ChimeConfig {
public:
    ChimeConfig();

    /// Merge the file over the built-in defaults.
    /// Returns false (and keeps defaults) if the file cannot be parsed or
    /// replaces one of the top-level sections with a non-mapping.
    bool load(const QString& filePath);
    void save(const QString& filePath) const;

    static QString defaultConfigPath();

    /// Relative paths resolve against the directory holding the executable.
    static QString programRelative(const QString& path);

    // Sounds
    QString soundsDirectory() const;
    void setSoundsDirectory(const QString& v);
    QString startSoundName() const;
    QString completeSoundName() const;
    QString soundPlayer() const;
    void setSoundPlayer(const QString& v);

    // Icons
    QString bundledIcon() const;
    void setBundledIcon(const QString& v);
    QString appDefaultIcon() const;
    void setAppDefaultIcon(const QString& v);
    QString alertIcon() const;
    void setAlertIcon(const QString& v);

    // Titles
    QString startTitle() const;
    QString completeTitle() const;

    // Visual delivery
    int scriptTimeoutMs() const;
    int settleDelayMs() const;
    void setSettleDelayMs(int v);
    QString notifierActivate() const;
    QString notifierSender() const;
    /// Clamped to [0, MaxBannerTimeoutSec].
    int bannerTimeoutSec() const;
    static constexpr int MaxBannerTimeoutSec = 3600;

    // Pre-delivery hook
    bool hookEnabled() const;
    void setHookEnabled(bool v);
    QString hookScript() const;
    void setHookScript(const QString& v);
    int hookTimeoutMs() const;

    // Local socket server
    QString socketPath() const;
    void setSocketPath(const QString& v);

private:
    YAML::Node root_;

    void initDefaults();
};

} // namespace chime
