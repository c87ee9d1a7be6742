#include "Diagnostics.hpp"
#include "IVisualDeliverer.hpp"
#include "core/ChimeConfig.hpp"
#include "core/ResourceResolver.hpp"
#include "core/Version.hpp"
#include "core/delivery/AppleScriptMethod.hpp"
#include "core/delivery/NotificationCenterMethod.hpp"
#include "core/process/IProcessRunner.hpp"
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace chime {

static const QString TEST_TITLE = QString::fromLatin1(APP_NAME);
static const QString TEST_MESSAGE = QStringLiteral("Initializing notification permissions");

Diagnostics::Diagnostics(const ChimeConfig& config, const ResourceResolver& resolver,
                         IProcessRunner& runner, IVisualDeliverer& visual)
    : config_(config)
    , resolver_(resolver)
    , runner_(runner)
    , visual_(visual)
{
}

bool Diagnostics::verifySounds(QStringList* missing) const
{
    bool ok = true;
    for (auto kind : {NotificationKind::Start, NotificationKind::Complete}) {
        QString path = resolver_.resolveSound(kind);
        if (!QFileInfo::exists(path)) {
            BOOST_LOG_TRIVIAL(warning) << "Diagnostics: " << soundRole(kind).toStdString()
                                       << " sound file not found at " << path.toStdString();
            if (missing)
                missing->append(path);
            ok = false;
        }
    }
    return ok;
}

QStringList Diagnostics::availableMechanisms() const
{
    QStringList found;
    if (!runner_.findExecutable(QStringLiteral("osascript")).isEmpty())
        found << QStringLiteral("applescript");
    if (!runner_.findExecutable(QStringLiteral("terminal-notifier")).isEmpty())
        found << QStringLiteral("terminal-notifier");
    if (NotificationCenterMethod::isServiceAvailable())
        found << QStringLiteral("notification-center");
    if (!runner_.findExecutable(QStringLiteral("notify-send")).isEmpty())
        found << QStringLiteral("notify-send");
    return found;
}

bool Diagnostics::verifyVisual()
{
    if (!resolver_.visualEnabled()) {
        BOOST_LOG_TRIVIAL(info) << "Diagnostics: visual notifications are disabled by environment";
        return true;
    }

    QStringList mechanisms = availableMechanisms();
    if (mechanisms.isEmpty())
        BOOST_LOG_TRIVIAL(warning) << "Diagnostics: no visual notification mechanism found";
    else
        BOOST_LOG_TRIVIAL(info) << "Diagnostics: available mechanisms: "
                                << mechanisms.join(", ").toStdString();

    QString icon = resolver_.resolveIcon();
    if (icon.isEmpty())
        BOOST_LOG_TRIVIAL(info) << "Diagnostics: no notification icon found, sending without one";
    else
        BOOST_LOG_TRIVIAL(info) << "Diagnostics: notification icon: " << icon.toStdString();

    BOOST_LOG_TRIVIAL(info) << "Diagnostics: sending test notification";
    if (visual_.send(TEST_TITLE, TEST_MESSAGE, icon).delivered)
        return true;

    BOOST_LOG_TRIVIAL(warning) << "Diagnostics: test notification failed, retrying with osascript";
    AppleScriptMethod direct(runner_, config_.scriptTimeoutMs(), config_.settleDelayMs());
    if (direct.attempt(TEST_TITLE, QStringLiteral("Testing notification permissions"), icon))
        return true;

    BOOST_LOG_TRIVIAL(warning) << "Diagnostics: all notification methods failed; "
                                  "check notification permissions in System Settings";
    return false;
}

QStringList Diagnostics::listSystemSounds(const QString& dir)
{
    QDir sounds(dir);
    if (!sounds.exists()) {
        BOOST_LOG_TRIVIAL(error) << "Diagnostics: cannot list sounds in " << dir.toStdString();
        return {};
    }
    return sounds.entryList({QStringLiteral("*.aiff")}, QDir::Files, QDir::Name);
}

} // namespace chime
