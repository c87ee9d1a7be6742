#include "AppleScriptMethod.hpp"
#include "core/process/IProcessRunner.hpp"
#include <QThread>
#include <boost/log/trivial.hpp>

namespace chime {

static QString escapeForAppleScript(const QString& input)
{
    QString output;
    output.reserve(input.size());
    for (QChar c : input) {
        if (c == QLatin1Char('"') || c == QLatin1Char('\\'))
            output.append(QLatin1Char('\\'));
        output.append(c);
    }
    return output;
}

AppleScriptMethod::AppleScriptMethod(IProcessRunner& runner, int timeoutMs, int settleDelayMs)
    : runner_(runner)
    , timeoutMs_(timeoutMs)
    , settleDelayMs_(settleDelayMs)
{
}

QString AppleScriptMethod::buildScript(const QString& title, const QString& message)
{
    // "delay 1" keeps System Events alive long enough for the banner to post
    return QStringLiteral(
               "tell application \"System Events\"\n"
               "    display notification \"%1\" with title \"%2\"\n"
               "    delay 1\n"
               "end tell")
        .arg(escapeForAppleScript(message), escapeForAppleScript(title));
}

bool AppleScriptMethod::attempt(const QString& title, const QString& message,
                                const QString& /*iconPath*/)
{
    BOOST_LOG_TRIVIAL(info) << "AppleScriptMethod: sending notification";
    ProcessResult r = runner_.run(QStringLiteral("osascript"),
                                  {QStringLiteral("-e"), buildScript(title, message)},
                                  timeoutMs_);
    if (r.timedOut) {
        BOOST_LOG_TRIVIAL(error) << "AppleScriptMethod: osascript timed out";
        return false;
    }
    if (!r.succeeded()) {
        BOOST_LOG_TRIVIAL(error) << "AppleScriptMethod: osascript failed (exit " << r.exitCode
                                 << "): " << (r.started ? r.stdErr.trimmed().toStdString()
                                                        : r.errorString.toStdString());
        return false;
    }

    if (settleDelayMs_ > 0)
        QThread::msleep(static_cast<unsigned long>(settleDelayMs_));
    return true;
}

} // namespace chime
