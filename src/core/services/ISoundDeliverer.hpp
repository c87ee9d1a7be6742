#pragma once

#include <QString>

namespace chime {

class ISoundDeliverer {
public:
    virtual ~ISoundDeliverer() = default;

    /// Play the file synchronously. Returns true only on a clean player exit.
    /// A missing file returns false without launching anything.
    virtual bool play(const QString& path) = 0;
};

} // namespace chime
