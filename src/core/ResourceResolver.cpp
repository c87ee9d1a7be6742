#include "core/ResourceResolver.hpp"
#include "core/ChimeConfig.hpp"
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace chime {

namespace {

QString existingFromEnv(const char* name)
{
    QString path = qEnvironmentVariable(name);
    if (path.isEmpty())
        return {};
    if (!QFileInfo::exists(path)) {
        BOOST_LOG_TRIVIAL(debug) << "ResourceResolver: " << name << " points at missing file "
                                 << path.toStdString() << ", ignored";
        return {};
    }
    return path;
}

} // namespace

ResourceResolver::ResourceResolver(const ChimeConfig& config)
    : config_(config)
{
}

ResourceConfig ResourceResolver::resolve() const
{
    ResourceConfig rc;
    rc.legacySoundPath = legacySound();
    rc.startSoundPath = kindSound(NotificationKind::Start);
    rc.completeSoundPath = kindSound(NotificationKind::Complete);
    rc.visualNotificationsEnabled = visualEnabled();
    if (rc.visualNotificationsEnabled)
        rc.iconPath = resolveIcon();
    return rc;
}

QString ResourceResolver::resolveSound(NotificationKind kind) const
{
    QString legacy = legacySound();
    if (!legacy.isEmpty()) {
        BOOST_LOG_TRIVIAL(info) << "ResourceResolver: using legacy sound override for "
                                << soundRole(kind).toStdString() << ": " << legacy.toStdString();
        return legacy;
    }
    return kindSound(kind);
}

QString ResourceResolver::legacySound() const
{
    return existingFromEnv(env::LegacySound);
}

QString ResourceResolver::kindSound(NotificationKind kind) const
{
    const bool start = kind == NotificationKind::Start;
    QString custom = existingFromEnv(start ? env::StartSound : env::CompleteSound);
    if (!custom.isEmpty()) {
        BOOST_LOG_TRIVIAL(debug) << "ResourceResolver: custom " << soundRole(kind).toStdString()
                                 << " sound: " << custom.toStdString();
        return custom;
    }

    QString name = start ? config_.startSoundName() : config_.completeSoundName();
    return QDir(config_.soundsDirectory()).filePath(name);
}

QString ResourceResolver::resolveIcon() const
{
    QString custom = existingFromEnv(env::NotificationIcon);
    if (!custom.isEmpty()) {
        BOOST_LOG_TRIVIAL(debug) << "ResourceResolver: custom notification icon: "
                                 << custom.toStdString();
        return custom;
    }

    QString bundled = config_.bundledIcon();
    if (!bundled.isEmpty() && QFileInfo::exists(bundled))
        return bundled;

    QString appIcon = config_.appDefaultIcon();
    if (!appIcon.isEmpty() && QFileInfo::exists(appIcon))
        return appIcon;

    return {};
}

bool ResourceResolver::visualEnabled() const
{
    if (!qEnvironmentVariableIsSet(env::VisualNotifications))
        return true;
    // Set but empty counts as "not truthy"
    const QString value = qEnvironmentVariable(env::VisualNotifications);
    return !value.isEmpty() && parseFlag(value);
}

} // namespace chime
