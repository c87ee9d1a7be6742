#include "core/ChimeConfig.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <fstream>

namespace chime {

namespace {

// Maps recurse; scalars and sequences from the overlay replace the base.
void mergeInto(YAML::Node base, const YAML::Node& overlay)
{
    if (!overlay.IsMap())
        return;

    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        YAML::Node target = base[key];
        if (target.IsMap() && it->second.IsMap())
            mergeInto(target, it->second);
        else
            base[key] = YAML::Clone(it->second);
    }
}

QString stringAt(const YAML::Node& node, const char* fallback)
{
    return QString::fromStdString(node.as<std::string>(fallback));
}

} // namespace

ChimeConfig::ChimeConfig()
{
    initDefaults();
}

void ChimeConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["sounds"]["directory"] = "/System/Library/Sounds/";
    root_["sounds"]["start"] = "Glass.aiff";
    root_["sounds"]["complete"] = "Hero.aiff";
    root_["sounds"]["player"] = "afplay";

    root_["icons"]["bundled"] = "task-chime-icon.png";
    root_["icons"]["app_default"] = "/Applications/Claude.app/Contents/Resources/AppIcon.icns";
    root_["icons"]["alert"] =
        "/System/Library/CoreServices/CoreTypes.bundle/Contents/Resources/AlertNoteIcon.icns";

    root_["titles"]["start"] = "Assistant is Processing";
    root_["titles"]["complete"] = "Assistant Response Ready";

    root_["visual"]["script_timeout_ms"] = 5000;
    root_["visual"]["settle_delay_ms"] = 500;
    root_["visual"]["notifier_activate"] = "com.anthropic.claude";
    root_["visual"]["notifier_sender"] = "com.apple.Terminal";
    root_["visual"]["banner_timeout_s"] = 10;

    root_["hook"]["enabled"] = true;
    root_["hook"]["script"] = "notify-helper.sh";
    root_["hook"]["timeout_ms"] = 15000;

    root_["server"]["socket"] = "/tmp/task-chime.sock";
}

bool ChimeConfig::load(const QString& filePath)
{
    YAML::Node loaded;
    try {
        loaded = YAML::LoadFile(filePath.toStdString());
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "ChimeConfig: cannot read " << filePath.toStdString()
                                   << " (" << e.what() << "), using defaults";
        return false;
    }

    initDefaults();
    try {
        mergeInto(root_, loaded);
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "ChimeConfig: cannot merge " << filePath.toStdString()
                                   << " (" << e.what() << "), using defaults";
        initDefaults();
        return false;
    }

    // Getters subscript into these, so each must still be a map
    for (const char* section : {"sounds", "icons", "titles", "visual", "hook", "server"}) {
        if (!root_[section].IsMap()) {
            BOOST_LOG_TRIVIAL(warning) << "ChimeConfig: '" << section << "' in "
                                       << filePath.toStdString()
                                       << " is not a mapping, using defaults";
            initDefaults();
            return false;
        }
    }

    BOOST_LOG_TRIVIAL(info) << "ChimeConfig: loaded " << filePath.toStdString();
    return true;
}

void ChimeConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

QString ChimeConfig::defaultConfigPath()
{
    return QDir::homePath() + "/.config/task-chime/config.yaml";
}

QString ChimeConfig::programRelative(const QString& path)
{
    if (path.isEmpty() || QFileInfo(path).isAbsolute())
        return path;
    return QDir(QCoreApplication::applicationDirPath()).filePath(path);
}

// --- Sounds ---

QString ChimeConfig::soundsDirectory() const
{
    return stringAt(root_["sounds"]["directory"], "/System/Library/Sounds/");
}

void ChimeConfig::setSoundsDirectory(const QString& v)
{
    root_["sounds"]["directory"] = v.toStdString();
}

QString ChimeConfig::startSoundName() const
{
    return stringAt(root_["sounds"]["start"], "Glass.aiff");
}

QString ChimeConfig::completeSoundName() const
{
    return stringAt(root_["sounds"]["complete"], "Hero.aiff");
}

QString ChimeConfig::soundPlayer() const
{
    return stringAt(root_["sounds"]["player"], "afplay");
}

void ChimeConfig::setSoundPlayer(const QString& v)
{
    root_["sounds"]["player"] = v.toStdString();
}

// --- Icons ---

QString ChimeConfig::bundledIcon() const
{
    return programRelative(stringAt(root_["icons"]["bundled"], ""));
}

void ChimeConfig::setBundledIcon(const QString& v)
{
    root_["icons"]["bundled"] = v.toStdString();
}

QString ChimeConfig::appDefaultIcon() const
{
    return stringAt(root_["icons"]["app_default"], "");
}

void ChimeConfig::setAppDefaultIcon(const QString& v)
{
    root_["icons"]["app_default"] = v.toStdString();
}

QString ChimeConfig::alertIcon() const
{
    return stringAt(root_["icons"]["alert"], "");
}

void ChimeConfig::setAlertIcon(const QString& v)
{
    root_["icons"]["alert"] = v.toStdString();
}

// --- Titles ---

QString ChimeConfig::startTitle() const
{
    return stringAt(root_["titles"]["start"], "Assistant is Processing");
}

QString ChimeConfig::completeTitle() const
{
    return stringAt(root_["titles"]["complete"], "Assistant Response Ready");
}

// --- Visual delivery ---

int ChimeConfig::scriptTimeoutMs() const
{
    return root_["visual"]["script_timeout_ms"].as<int>(5000);
}

int ChimeConfig::settleDelayMs() const
{
    return root_["visual"]["settle_delay_ms"].as<int>(500);
}

void ChimeConfig::setSettleDelayMs(int v)
{
    root_["visual"]["settle_delay_ms"] = v;
}

QString ChimeConfig::notifierActivate() const
{
    return stringAt(root_["visual"]["notifier_activate"], "");
}

QString ChimeConfig::notifierSender() const
{
    return stringAt(root_["visual"]["notifier_sender"], "");
}

int ChimeConfig::bannerTimeoutSec() const
{
    return std::clamp(root_["visual"]["banner_timeout_s"].as<int>(10), 0, MaxBannerTimeoutSec);
}

// --- Hook ---

bool ChimeConfig::hookEnabled() const
{
    return root_["hook"]["enabled"].as<bool>(true);
}

void ChimeConfig::setHookEnabled(bool v)
{
    root_["hook"]["enabled"] = v;
}

QString ChimeConfig::hookScript() const
{
    return programRelative(stringAt(root_["hook"]["script"], ""));
}

void ChimeConfig::setHookScript(const QString& v)
{
    root_["hook"]["script"] = v.toStdString();
}

int ChimeConfig::hookTimeoutMs() const
{
    return root_["hook"]["timeout_ms"].as<int>(15000);
}

// --- Server ---

QString ChimeConfig::socketPath() const
{
    return stringAt(root_["server"]["socket"], "/tmp/task-chime.sock");
}

void ChimeConfig::setSocketPath(const QString& v)
{
    root_["server"]["socket"] = v.toStdString();
}

} // namespace chime
