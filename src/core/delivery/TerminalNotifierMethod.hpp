#pragma once

#include "IDeliveryMethod.hpp"
#include <QStringList>

namespace chime {

class ChimeConfig;
class IProcessRunner;

/// The terminal-notifier helper CLI, used only when it is on PATH.
/// Never passes -sound: audio is SoundDeliverer's job, and passing it here
/// would play the alert twice.
class TerminalNotifierMethod : public IDeliveryMethod {
public:
    TerminalNotifierMethod(IProcessRunner& runner, const ChimeConfig& config);

    QString name() const override { return QStringLiteral("terminal-notifier"); }
    bool attempt(const QString& title, const QString& message,
                 const QString& iconPath) override;

    /// Explicit icon → application icon → generic alert icon → empty.
    QString chooseIcon(const QString& iconPath) const;

    QStringList buildArguments(const QString& title, const QString& message,
                               const QString& icon) const;

private:
    IProcessRunner& runner_;
    const ChimeConfig& config_;
};

} // namespace chime
