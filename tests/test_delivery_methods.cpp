#include <QtTest>
#include <QTemporaryDir>
#include <exception>
#include "FakeProcessRunner.hpp"
#include "core/ChimeConfig.hpp"
#include "core/delivery/AppleScriptMethod.hpp"
#include "core/delivery/NotificationCenterMethod.hpp"
#include "core/delivery/NotifySendMethod.hpp"
#include "core/delivery/TerminalNotifierMethod.hpp"

class TestDeliveryMethods : public QObject {
    Q_OBJECT
private slots:
    void init();

    void testAppleScriptEscapesQuotes();
    void testAppleScriptRunsOsascript();
    void testAppleScriptFailure();
    void testTerminalNotifierSkippedWhenMissing();
    void testTerminalNotifierArguments();
    void testTerminalNotifierNeverPassesSound();
    void testTerminalNotifierIconFallback();
    void testTerminalNotifierTimeout();
    void testNotifySendSkippedWhenMissing();
    void testNotifySendArguments();
    void testNotificationCenterName();
    void testNotificationCenterSkippedWithoutBus();

private:
    QString touch(const QString& name);

    QTemporaryDir dir_;
    chime::ChimeConfig config_;
};

void TestDeliveryMethods::init()
{
    QVERIFY(dir_.isValid());
    config_.setSettleDelayMs(0);
    config_.setAppDefaultIcon(dir_.filePath("missing-app.icns"));
    config_.setAlertIcon(dir_.filePath("missing-alert.icns"));
}

QString TestDeliveryMethods::touch(const QString& name)
{
    QString path = dir_.filePath(name);
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly))
        return {};
    return path;
}

void TestDeliveryMethods::testAppleScriptEscapesQuotes()
{
    QString script = chime::AppleScriptMethod::buildScript("Say \"hi\"", "path C:\\tmp \"x\"");
    QVERIFY(script.contains("display notification \"path C:\\\\tmp \\\"x\\\"\""));
    QVERIFY(script.contains("with title \"Say \\\"hi\\\"\""));
    QVERIFY(script.startsWith("tell application \"System Events\""));
}

void TestDeliveryMethods::testAppleScriptRunsOsascript()
{
    FakeProcessRunner runner;
    chime::AppleScriptMethod method(runner, 5000, 0);
    QVERIFY(method.attempt("Title", "Body", QString()));

    QCOMPARE(runner.calls.size(), 1);
    QCOMPARE(runner.calls[0].program, QString("osascript"));
    QCOMPARE(runner.calls[0].args.value(0), QString("-e"));
    QCOMPARE(runner.calls[0].timeoutMs, 5000);
}

void TestDeliveryMethods::testAppleScriptFailure()
{
    FakeProcessRunner runner;
    runner.handler = [](const FakeProcessRunner::Call&) { return FakeProcessRunner::notStarted(); };
    chime::AppleScriptMethod method(runner, 5000, 0);
    QVERIFY(!method.attempt("Title", "Body", QString()));

    runner.handler = [](const FakeProcessRunner::Call&) { return FakeProcessRunner::timedOut(); };
    QVERIFY(!method.attempt("Title", "Body", QString()));
}

void TestDeliveryMethods::testTerminalNotifierSkippedWhenMissing()
{
    FakeProcessRunner runner;
    chime::TerminalNotifierMethod method(runner, config_);
    QVERIFY(!method.attempt("Title", "Body", QString()));
    QVERIFY(runner.calls.isEmpty());
}

void TestDeliveryMethods::testTerminalNotifierArguments()
{
    FakeProcessRunner runner;
    runner.executables["terminal-notifier"] = "/usr/local/bin/terminal-notifier";
    QString icon = touch("icon.png");

    chime::TerminalNotifierMethod method(runner, config_);
    QVERIFY(method.attempt("Title", "Body", icon));

    QCOMPARE(runner.calls.size(), 1);
    const auto& call = runner.calls[0];
    QCOMPARE(call.program, QString("/usr/local/bin/terminal-notifier"));
    QCOMPARE(call.timeoutMs, config_.scriptTimeoutMs());

    const QStringList& a = call.args;
    QCOMPARE(a.value(a.indexOf("-title") + 1), QString("Title"));
    QCOMPARE(a.value(a.indexOf("-message") + 1), QString("Body"));
    QCOMPARE(a.value(a.indexOf("-activate") + 1), config_.notifierActivate());
    QCOMPARE(a.value(a.indexOf("-sender") + 1), config_.notifierSender());
    QCOMPARE(a.value(a.indexOf("-contentImage") + 1), icon);
    QCOMPARE(a.value(a.indexOf("-appIcon") + 1), icon);
    QCOMPARE(a.value(a.indexOf("-timeout") + 1), QString("10"));
}

void TestDeliveryMethods::testTerminalNotifierNeverPassesSound()
{
    FakeProcessRunner runner;
    runner.executables["terminal-notifier"] = "/opt/bin/terminal-notifier";
    chime::TerminalNotifierMethod method(runner, config_);
    QVERIFY(method.attempt("Title", "Body", touch("icon.png")));
    QVERIFY(!runner.calls[0].args.contains("-sound"));
}

void TestDeliveryMethods::testTerminalNotifierIconFallback()
{
    FakeProcessRunner runner;
    chime::TerminalNotifierMethod method(runner, config_);

    QCOMPARE(method.chooseIcon(QString()), QString());
    QVERIFY(!method.buildArguments("T", "M", QString()).contains("-appIcon"));

    QString alert = touch("alert.icns");
    config_.setAlertIcon(alert);
    QCOMPARE(method.chooseIcon(dir_.filePath("gone.png")), alert);

    QString app = touch("app.icns");
    config_.setAppDefaultIcon(app);
    QCOMPARE(method.chooseIcon(QString()), app);

    QString explicitIcon = touch("explicit.png");
    QCOMPARE(method.chooseIcon(explicitIcon), explicitIcon);
}

void TestDeliveryMethods::testTerminalNotifierTimeout()
{
    FakeProcessRunner runner;
    runner.executables["terminal-notifier"] = "/opt/bin/terminal-notifier";
    runner.handler = [](const FakeProcessRunner::Call&) { return FakeProcessRunner::timedOut(); };
    chime::TerminalNotifierMethod method(runner, config_);
    QVERIFY(!method.attempt("Title", "Body", QString()));
}

void TestDeliveryMethods::testNotifySendSkippedWhenMissing()
{
    FakeProcessRunner runner;
    chime::NotifySendMethod method(runner, 5000, 10000);
    QVERIFY(!method.attempt("Title", "Body", QString()));
    QVERIFY(runner.calls.isEmpty());
}

void TestDeliveryMethods::testNotifySendArguments()
{
    FakeProcessRunner runner;
    runner.executables["notify-send"] = "/usr/bin/notify-send";
    chime::NotifySendMethod method(runner, 5000, 10000);
    QVERIFY(method.attempt("Title", "-Body", "/tmp/icon.png"));

    QCOMPARE(runner.calls[0].program, QString("/usr/bin/notify-send"));
    QCOMPARE(runner.calls[0].args,
             QStringList({"--app-name=Task Chime", "--expire-time=10000", "--icon=/tmp/icon.png",
                          "--", "Title", "-Body"}));

    QVERIFY(!method.buildArguments("T", "M", QString()).join(' ').contains("--icon"));
}

void TestDeliveryMethods::testNotificationCenterName()
{
    chime::NotificationCenterMethod method(5000);
    QCOMPARE(method.name(), QString("notification-center"));
}

void TestDeliveryMethods::testNotificationCenterSkippedWithoutBus()
{
    // Session bus is connected lazily on first use, so this must precede any D-Bus call
    qputenv("DBUS_SESSION_BUS_ADDRESS",
            "unix:path=" + dir_.filePath("no-such-bus").toUtf8());

    QVERIFY(!chime::NotificationCenterMethod::isServiceAvailable());

    chime::NotificationCenterMethod method(500);
    bool delivered = true;
    try {
        delivered = method.attempt("Title", "Body", QString());
    } catch (const std::exception& e) {
        QFAIL(e.what());
    }
    QVERIFY(!delivered);
}

QTEST_MAIN(TestDeliveryMethods)
#include "test_delivery_methods.moc"
