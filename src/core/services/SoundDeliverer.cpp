#include "SoundDeliverer.hpp"
#include "core/process/IProcessRunner.hpp"
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace chime {

SoundDeliverer::SoundDeliverer(IProcessRunner& runner, const QString& player)
    : runner_(runner)
    , player_(player)
{
}

bool SoundDeliverer::play(const QString& path)
{
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        BOOST_LOG_TRIVIAL(error) << "SoundDeliverer: sound file does not exist: "
                                 << path.toStdString();
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "SoundDeliverer: playing " << path.toStdString();
    ProcessResult r = runner_.run(player_, {path});

    if (!r.started) {
        BOOST_LOG_TRIVIAL(error) << "SoundDeliverer: " << player_.toStdString()
                                 << " not available: " << r.errorString.toStdString();
        return false;
    }
    if (!r.succeeded()) {
        BOOST_LOG_TRIVIAL(error) << "SoundDeliverer: " << player_.toStdString()
                                 << " exited with " << r.exitCode
                                 << ", stderr: " << r.stdErr.trimmed().toStdString();
        return false;
    }

    BOOST_LOG_TRIVIAL(debug) << "SoundDeliverer: played successfully";
    return true;
}

} // namespace chime
