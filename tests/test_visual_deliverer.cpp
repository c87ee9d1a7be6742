#include <QtTest>
#include <stdexcept>
#include "FakeProcessRunner.hpp"
#include "core/ChimeConfig.hpp"
#include "core/delivery/IDeliveryMethod.hpp"
#include "core/services/VisualDeliverer.hpp"

namespace {

class ScriptedMethod : public chime::IDeliveryMethod {
public:
    enum Behavior { Succeed, Fail, Throw };

    ScriptedMethod(const QString& name, Behavior behavior, QStringList* log)
        : name_(name), behavior_(behavior), log_(log) {}

    QString name() const override { return name_; }

    bool attempt(const QString&, const QString&, const QString&) override
    {
        log_->append(name_);
        if (behavior_ == Throw)
            throw std::runtime_error("backend exploded");
        return behavior_ == Succeed;
    }

private:
    QString name_;
    Behavior behavior_;
    QStringList* log_;
};

chime::VisualDeliverer makeDeliverer(std::initializer_list<std::pair<const char*, ScriptedMethod::Behavior>> spec,
                                     QStringList* log)
{
    chime::VisualDeliverer::Methods methods;
    for (const auto& entry : spec)
        methods.push_back(std::make_unique<ScriptedMethod>(entry.first, entry.second, log));
    return chime::VisualDeliverer(std::move(methods));
}

} // namespace

class TestVisualDeliverer : public QObject {
    Q_OBJECT
private slots:
    void testStopsAtFirstSuccess();
    void testFallsThroughFailures();
    void testThrowingMethodCountsAsFailure();
    void testAllFail();
    void testDefaultOrder();
};

void TestVisualDeliverer::testStopsAtFirstSuccess()
{
    QStringList log;
    auto visual = makeDeliverer({{"a", ScriptedMethod::Succeed}, {"b", ScriptedMethod::Succeed}}, &log);

    auto result = visual.send("T", "M", QString());
    QVERIFY(result.delivered);
    QCOMPARE(result.method, QString("a"));
    QCOMPARE(log, QStringList{"a"});
}

void TestVisualDeliverer::testFallsThroughFailures()
{
    QStringList log;
    auto visual = makeDeliverer({{"a", ScriptedMethod::Fail},
                                 {"b", ScriptedMethod::Fail},
                                 {"c", ScriptedMethod::Succeed},
                                 {"d", ScriptedMethod::Succeed}},
                                &log);

    auto result = visual.send("T", "M", QString());
    QVERIFY(result.delivered);
    QCOMPARE(result.method, QString("c"));
    QCOMPARE(log, QStringList({"a", "b", "c"}));
}

void TestVisualDeliverer::testThrowingMethodCountsAsFailure()
{
    QStringList log;
    auto visual = makeDeliverer({{"a", ScriptedMethod::Throw}, {"b", ScriptedMethod::Succeed}}, &log);

    auto result = visual.send("T", "M", QString());
    QVERIFY(result.delivered);
    QCOMPARE(result.method, QString("b"));
}

void TestVisualDeliverer::testAllFail()
{
    QStringList log;
    auto visual = makeDeliverer({{"a", ScriptedMethod::Fail}, {"b", ScriptedMethod::Throw}}, &log);

    auto result = visual.send("T", "M", QString());
    QVERIFY(!result.delivered);
    QVERIFY(result.method.isEmpty());
    QCOMPARE(log.size(), 2);
}

void TestVisualDeliverer::testDefaultOrder()
{
    FakeProcessRunner runner;
    chime::ChimeConfig config;
    chime::VisualDeliverer visual(chime::VisualDeliverer::defaultMethods(runner, config));
    QCOMPARE(visual.methodNames(), QStringList({"applescript", "terminal-notifier",
                                                "notification-center", "notify-send"}));
}

QTEST_MAIN(TestVisualDeliverer)
#include "test_visual_deliverer.moc"
