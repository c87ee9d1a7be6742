#include "VisualDeliverer.hpp"
#include "core/ChimeConfig.hpp"
#include "core/delivery/AppleScriptMethod.hpp"
#include "core/delivery/NotificationCenterMethod.hpp"
#include "core/delivery/NotifySendMethod.hpp"
#include "core/delivery/TerminalNotifierMethod.hpp"
#include <boost/log/trivial.hpp>
#include <exception>

namespace chime {

VisualDeliverer::VisualDeliverer(Methods methods)
    : methods_(std::move(methods))
{
}

VisualDeliverer::Methods VisualDeliverer::defaultMethods(IProcessRunner& runner,
                                                         const ChimeConfig& config)
{
    const int timeoutMs = config.scriptTimeoutMs();

    Methods methods;
    methods.push_back(std::make_unique<AppleScriptMethod>(runner, timeoutMs, config.settleDelayMs()));
    methods.push_back(std::make_unique<TerminalNotifierMethod>(runner, config));
    methods.push_back(std::make_unique<NotificationCenterMethod>(timeoutMs));
    methods.push_back(std::make_unique<NotifySendMethod>(runner, timeoutMs,
                                                         config.bannerTimeoutSec() * 1000));
    return methods;
}

VisualResult VisualDeliverer::send(const QString& title, const QString& message,
                                   const QString& iconPath)
{
    BOOST_LOG_TRIVIAL(info) << "VisualDeliverer: sending '" << title.toStdString() << "' - "
                            << message.toStdString();

    int tried = 0;
    for (const auto& method : methods_) {
        ++tried;
        bool ok = false;
        try {
            ok = method->attempt(title, message, iconPath);
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "VisualDeliverer: " << method->name().toStdString()
                                       << " threw: " << e.what();
        }

        BOOST_LOG_TRIVIAL(debug) << "VisualDeliverer: " << method->name().toStdString()
                                 << " attempted: " << ok;
        if (ok) {
            BOOST_LOG_TRIVIAL(info) << "VisualDeliverer: delivered via "
                                    << method->name().toStdString();
            return {true, method->name()};
        }
    }

    BOOST_LOG_TRIVIAL(warning) << "VisualDeliverer: all " << tried << " methods failed";
    return {};
}

QStringList VisualDeliverer::methodNames() const
{
    QStringList names;
    for (const auto& method : methods_)
        names << method->name();
    return names;
}

} // namespace chime
