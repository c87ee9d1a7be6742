#pragma once

#include "IVisualDeliverer.hpp"
#include "core/delivery/IDeliveryMethod.hpp"
#include <QStringList>
#include <memory>
#include <vector>

namespace chime {

class ChimeConfig;
class IProcessRunner;

/// Tries an ordered list of delivery methods one at a time, stopping at the
/// first success. Attempts are never parallel: two working methods would
/// show the user two banners.
class VisualDeliverer : public IVisualDeliverer {
public:
    using Methods = std::vector<std::unique_ptr<IDeliveryMethod>>;

    explicit VisualDeliverer(Methods methods);

    /// applescript → terminal-notifier → notification-center → notify-send
    static Methods defaultMethods(IProcessRunner& runner, const ChimeConfig& config);

    VisualResult send(const QString& title, const QString& message,
                      const QString& iconPath) override;

    QStringList methodNames() const;

private:
    Methods methods_;
};

} // namespace chime
