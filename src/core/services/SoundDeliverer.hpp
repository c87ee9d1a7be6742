#pragma once

#include "ISoundDeliverer.hpp"

namespace chime {

class IProcessRunner;

/// Plays alert sounds through an external command-line player (afplay).
/// Alert sounds are short, so the player runs without a timeout.
class SoundDeliverer : public ISoundDeliverer {
public:
    SoundDeliverer(IProcessRunner& runner, const QString& player);

    bool play(const QString& path) override;

    QString player() const { return player_; }

private:
    IProcessRunner& runner_;
    QString player_;
};

} // namespace chime
