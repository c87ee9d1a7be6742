#include "NotificationCoordinator.hpp"
#include "IDeliveryHook.hpp"
#include "ISoundDeliverer.hpp"
#include "IVisualDeliverer.hpp"
#include "core/ChimeConfig.hpp"
#include "core/ResourceResolver.hpp"
#include <boost/log/trivial.hpp>
#include <exception>

namespace chime {

NotificationCoordinator::NotificationCoordinator(const ChimeConfig& config,
                                                 const ResourceResolver& resolver,
                                                 ISoundDeliverer& sound, IVisualDeliverer& visual)
    : config_(config)
    , resolver_(resolver)
    , sound_(sound)
    , visual_(visual)
{
}

QString NotificationCoordinator::titleFor(NotificationKind kind) const
{
    return kind == NotificationKind::Start ? config_.startTitle() : config_.completeTitle();
}

DeliveryOutcome NotificationCoordinator::notifyMessage(const QString& message)
{
    return notify(classifyMessage(message), message);
}

DeliveryOutcome NotificationCoordinator::notify(NotificationKind kind, const QString& message)
{
    BOOST_LOG_TRIVIAL(info) << "NotificationCoordinator: " << kindName(kind).toStdString()
                            << " notification: " << message.toStdString();

    const QString title = titleFor(kind);

    DeliveryOutcome outcome;
    outcome.message = message;

    if (hook_) {
        try {
            if (auto delegated = hook_->tryDeliver(kind, title, message)) {
                outcome.delegated = *delegated;
                return outcome;
            }
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "NotificationCoordinator: hook failed: " << e.what();
        }
    }

    const ResourceConfig resources = resolver_.resolve();

    outcome.soundPathUsed = resources.soundFor(kind);
    outcome.soundDelivered = sound_.play(outcome.soundPathUsed);

    if (resources.visualNotificationsEnabled) {
        VisualResult visual = visual_.send(title, message, resources.iconPath);
        outcome.visualDelivered = visual.delivered;
        outcome.methodUsed = visual.method;
    } else {
        BOOST_LOG_TRIVIAL(info) << "NotificationCoordinator: visual notifications disabled";
    }

    BOOST_LOG_TRIVIAL(info) << "NotificationCoordinator: sound=" << outcome.soundDelivered
                            << " visual=" << outcome.visualDelivered
                            << (outcome.methodUsed.isEmpty()
                                    ? std::string()
                                    : " via " + outcome.methodUsed.toStdString());
    return outcome;
}

} // namespace chime
