#include "HelperScriptHook.hpp"
#include "core/process/IProcessRunner.hpp"
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <boost/log/trivial.hpp>

namespace chime {

HelperScriptHook::HelperScriptHook(IProcessRunner& runner, const QString& scriptPath, int timeoutMs)
    : runner_(runner)
    , scriptPath_(scriptPath)
    , timeoutMs_(timeoutMs)
{
}

std::optional<QJsonObject> HelperScriptHook::tryDeliver(NotificationKind kind, const QString& title,
                                                        const QString& message)
{
    QFileInfo info(scriptPath_);
    if (scriptPath_.isEmpty() || !info.isFile()) {
        BOOST_LOG_TRIVIAL(debug) << "HelperScriptHook: no helper script at "
                                 << scriptPath_.toStdString() << ", using built-in delivery";
        return std::nullopt;
    }

    if (!info.isExecutable()) {
        auto perms = QFile::permissions(scriptPath_) | QFileDevice::ExeOwner
                     | QFileDevice::ExeUser | QFileDevice::ExeGroup | QFileDevice::ExeOther;
        if (!QFile::setPermissions(scriptPath_, perms)) {
            BOOST_LOG_TRIVIAL(warning) << "HelperScriptHook: cannot make "
                                       << scriptPath_.toStdString() << " executable";
            return std::nullopt;
        }
    }

    BOOST_LOG_TRIVIAL(info) << "HelperScriptHook: running " << scriptPath_.toStdString();
    ProcessResult r = runner_.run(scriptPath_, {title, message, kindName(kind)}, timeoutMs_);
    if (!r.succeeded()) {
        BOOST_LOG_TRIVIAL(warning) << "HelperScriptHook: script failed (exit " << r.exitCode
                                   << "): " << (r.started ? r.stdErr.trimmed().toStdString()
                                                          : r.errorString.toStdString());
        return std::nullopt;
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(r.stdOut.trimmed(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject() || doc.object().isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "HelperScriptHook: could not parse script output: "
                                   << r.stdOut.trimmed().toStdString();
        return std::nullopt;
    }

    BOOST_LOG_TRIVIAL(info) << "HelperScriptHook: script handled the notification";
    return doc.object();
}

} // namespace chime
