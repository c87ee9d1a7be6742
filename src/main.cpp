#include <signal.h>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QTextStream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <exception>
#include "core/ChimeConfig.hpp"
#include "core/ResourceResolver.hpp"
#include "core/Version.hpp"
#include "core/process/ProcessRunner.hpp"
#include "core/services/Diagnostics.hpp"
#include "core/services/HelperScriptHook.hpp"
#include "core/services/NotificationCoordinator.hpp"
#include "core/services/NotifyServer.hpp"
#include "core/services/SoundDeliverer.hpp"
#include "core/services/VisualDeliverer.hpp"

namespace {

int runServer(QCoreApplication& app, const chime::ChimeConfig& config,
              chime::NotificationCoordinator& coordinator, const chime::ResourceResolver& resolver,
              chime::Diagnostics& diagnostics)
{
    QTextStream out(stdout);
    out << chime::APP_NAME << " v" << chime::VERSION << "\n";
    out << "Available operation:\n";
    out << "  notify: call at the start and end of every task\n";
    out.flush();

    if (diagnostics.verifySounds())
        qInfo() << "All sound files verified";
    else
        qWarning() << "Some sound files could not be found. Check your configuration.";

    if (resolver.visualEnabled()) {
        if (diagnostics.verifyVisual())
            qInfo() << "Visual notification components verified";
        else
            qWarning() << "Visual notifications may not work correctly, run `task-chime check`";
    } else {
        qInfo() << "Visual notifications are disabled";
    }

    chime::NotifyServer server;
    server.setCoordinator(&coordinator);
    server.setResolver(&resolver);
    if (!server.start(config.socketPath()))
        return 1;

    // SIGINT/SIGTERM → leave the event loop; exec() then returns 0
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(qApp, []() { QCoreApplication::quit(); }, Qt::QueuedConnection);
    });
    signal(SIGTERM, [](int) {
        QMetaObject::invokeMethod(qApp, []() { QCoreApplication::quit(); }, Qt::QueuedConnection);
    });

    int ret = app.exec();
    server.stop();
    qInfo() << "Server stopped";
    return ret;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("task-chime");
    app.setApplicationVersion(chime::VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Sound and desktop notifications for assistant task events");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "notify (default), serve, check or sounds");
    parser.addPositionalArgument("message", "Status message for notify", "[message...]");

    QCommandLineOption configOption({"c", "config"}, "YAML settings file.", "path",
                                    chime::ChimeConfig::defaultConfigPath());
    QCommandLineOption socketOption("socket", "Local socket path for serve.", "path");
    QCommandLineOption verboseOption({"v", "verbose"}, "Log debug output.");
    QCommandLineOption noHookOption("no-hook", "Never delegate to the helper script.");
    parser.addOption(configOption);
    parser.addOption(socketOption);
    parser.addOption(verboseOption);
    parser.addOption(noHookOption);
    parser.process(app);

    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= (parser.isSet(verboseOption) ? boost::log::trivial::debug
                                                                       : boost::log::trivial::info));

    // Built-in defaults unless a settings file exists
    chime::ChimeConfig config;
    QString configPath = parser.value(configOption);
    if (QFile::exists(configPath))
        config.load(configPath);
    if (parser.isSet(socketOption))
        config.setSocketPath(parser.value(socketOption));
    if (parser.isSet(noHookOption))
        config.setHookEnabled(false);

    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0, QStringLiteral("notify"));

    chime::ProcessRunner runner;
    chime::ResourceResolver resolver(config);
    chime::SoundDeliverer sound(runner, config.soundPlayer());
    chime::VisualDeliverer visual(chime::VisualDeliverer::defaultMethods(runner, config));
    chime::NotificationCoordinator coordinator(config, resolver, sound, visual);
    chime::HelperScriptHook hook(runner, config.hookScript(), config.hookTimeoutMs());
    if (config.hookEnabled())
        coordinator.setHook(&hook);
    chime::Diagnostics diagnostics(config, resolver, runner, visual);

    QTextStream out(stdout);

    try {
        if (command == QLatin1String("notify")) {
            QString message = args.size() > 1 ? args.mid(1).join(' ') : QStringLiteral("Task completed");
            chime::DeliveryOutcome outcome = coordinator.notifyMessage(message);
            out << QJsonDocument(outcome.toJson()).toJson(QJsonDocument::Compact) << "\n";
            return outcome.success() ? 0 : 1;
        }

        if (command == QLatin1String("sounds")) {
            for (const auto& name : chime::Diagnostics::listSystemSounds(config.soundsDirectory()))
                out << name << "\n";
            return 0;
        }

        if (command == QLatin1String("check")) {
            QStringList missing;
            bool soundsOk = diagnostics.verifySounds(&missing);
            bool visualOk = diagnostics.verifyVisual();
            out << "sounds: " << (soundsOk ? QStringLiteral("ok") : "missing " + missing.join(", ")) << "\n";
            out << "visual: " << (visualOk ? "ok" : "failed") << "\n";
            return soundsOk && visualOk ? 0 : 1;
        }

        if (command == QLatin1String("serve"))
            return runServer(app, config, coordinator, resolver, diagnostics);
    } catch (const std::exception& e) {
        qCritical() << "task-chime:" << e.what();
        return 1;
    }

    qCritical() << "Unknown command" << command;
    parser.showHelp(1);
}
