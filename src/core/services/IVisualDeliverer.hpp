#pragma once

#include <QString>

namespace chime {

struct VisualResult {
    bool delivered = false;
    QString method;  ///< name of the method that succeeded, empty if none
};

class IVisualDeliverer {
public:
    virtual ~IVisualDeliverer() = default;

    /// Show a banner using the first method that succeeds. Never throws.
    virtual VisualResult send(const QString& title, const QString& message,
                              const QString& iconPath) = 0;
};

} // namespace chime
