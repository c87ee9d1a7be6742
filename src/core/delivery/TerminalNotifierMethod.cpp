#include "TerminalNotifierMethod.hpp"
#include "core/ChimeConfig.hpp"
#include "core/process/IProcessRunner.hpp"
#include <QFileInfo>
#include <QThread>
#include <boost/log/trivial.hpp>

namespace chime {

TerminalNotifierMethod::TerminalNotifierMethod(IProcessRunner& runner, const ChimeConfig& config)
    : runner_(runner)
    , config_(config)
{
}

QString TerminalNotifierMethod::chooseIcon(const QString& iconPath) const
{
    for (const QString& candidate : {iconPath, config_.appDefaultIcon(), config_.alertIcon()}) {
        if (!candidate.isEmpty() && QFileInfo::exists(candidate))
            return candidate;
    }
    return {};
}

QStringList TerminalNotifierMethod::buildArguments(const QString& title, const QString& message,
                                                   const QString& icon) const
{
    QStringList args = {QStringLiteral("-title"), title, QStringLiteral("-message"), message};

    if (!config_.notifierActivate().isEmpty())
        args << QStringLiteral("-activate") << config_.notifierActivate();
    if (!config_.notifierSender().isEmpty())
        args << QStringLiteral("-sender") << config_.notifierSender();

    if (!icon.isEmpty()) {
        args << QStringLiteral("-contentImage") << icon;
        args << QStringLiteral("-appIcon") << icon;
    }

    args << QStringLiteral("-timeout") << QString::number(config_.bannerTimeoutSec());
    return args;
}

bool TerminalNotifierMethod::attempt(const QString& title, const QString& message,
                                     const QString& iconPath)
{
    QString exe = runner_.findExecutable(QStringLiteral("terminal-notifier"));
    if (exe.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "TerminalNotifierMethod: terminal-notifier not found, "
                                      "install it with: brew install terminal-notifier";
        return false;
    }

    QStringList args = buildArguments(title, message, chooseIcon(iconPath));
    BOOST_LOG_TRIVIAL(info) << "TerminalNotifierMethod: sending notification via "
                            << exe.toStdString();

    ProcessResult r = runner_.run(exe, args, config_.scriptTimeoutMs());
    if (r.timedOut) {
        BOOST_LOG_TRIVIAL(error) << "TerminalNotifierMethod: command timed out";
        return false;
    }
    if (!r.succeeded()) {
        BOOST_LOG_TRIVIAL(error) << "TerminalNotifierMethod: failed (exit " << r.exitCode
                                 << "): " << r.stdErr.trimmed().toStdString();
        return false;
    }

    if (config_.settleDelayMs() > 0)
        QThread::msleep(static_cast<unsigned long>(config_.settleDelayMs()));
    return true;
}

} // namespace chime
