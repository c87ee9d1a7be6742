#include "NotifySendMethod.hpp"
#include "core/Version.hpp"
#include "core/process/IProcessRunner.hpp"
#include <boost/log/trivial.hpp>

namespace chime {

NotifySendMethod::NotifySendMethod(IProcessRunner& runner, int timeoutMs, int expireMs)
    : runner_(runner)
    , timeoutMs_(timeoutMs)
    , expireMs_(expireMs)
{
}

QStringList NotifySendMethod::buildArguments(const QString& title, const QString& message,
                                             const QString& iconPath) const
{
    QStringList args = {QStringLiteral("--app-name=%1").arg(QLatin1String(APP_NAME)),
                        QStringLiteral("--expire-time=%1").arg(expireMs_)};
    if (!iconPath.isEmpty())
        args << QStringLiteral("--icon=%1").arg(iconPath);
    args << QStringLiteral("--") << title << message;
    return args;
}

bool NotifySendMethod::attempt(const QString& title, const QString& message,
                               const QString& iconPath)
{
    QString exe = runner_.findExecutable(QStringLiteral("notify-send"));
    if (exe.isEmpty()) {
        BOOST_LOG_TRIVIAL(info) << "NotifySendMethod: notify-send not available";
        return false;
    }

    ProcessResult r = runner_.run(exe, buildArguments(title, message, iconPath), timeoutMs_);
    if (!r.succeeded()) {
        BOOST_LOG_TRIVIAL(warning) << "NotifySendMethod: failed (exit " << r.exitCode << "): "
                                   << (r.timedOut ? r.errorString.toStdString()
                                                  : r.stdErr.trimmed().toStdString());
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "NotifySendMethod: sent notification";
    return true;
}

} // namespace chime
