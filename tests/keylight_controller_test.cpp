#include <gtest/gtest.h>

#include <climits>

#include <QStringList>

#include "keylight_controller.h"
#include "test_support.h"

namespace keylight {
namespace {

using test::FakeLightEndpoint;
using test::pumpEvents;
using test::waitFor;

ControllerConfig testConfig(int debounceMs = 40)
{
    ControllerConfig config = defaultConfig();
    config.connection.host = QStringLiteral("127.0.0.1");
    config.debounceMs = debounceMs;
    config.brightness = LightBounds{5, 3, 100};
    config.temperature = LightBounds{10, 143, 344};
    config.initialBrightness = 50;
    config.initialTemperature = 170;
    return config;
}

TEST(LightControllerTest, StartsOffWithConfiguredDefaults)
{
    FakeLightEndpoint endpoint;
    LightController controller(testConfig(), &endpoint);

    EXPECT_FALSE(controller.state().on);
    EXPECT_EQ(controller.state().brightness, 50);
    EXPECT_EQ(controller.state().temperature, 170);
    EXPECT_TRUE(endpoint.sent.empty());
}

TEST(LightControllerTest, InitialValuesOutsideBoundsAreClamped)
{
    ControllerConfig config = testConfig();
    config.initialBrightness = 500;
    config.initialTemperature = 1;
    FakeLightEndpoint endpoint;
    LightController controller(config, &endpoint);

    EXPECT_EQ(controller.state().brightness, 100);
    EXPECT_EQ(controller.state().temperature, 143);
}

TEST(LightControllerTest, HugeStepsStayInBounds)
{
    ControllerConfig config = testConfig();
    config.brightness.step = INT_MAX;
    config.temperature.step = INT_MAX;
    QString error;
    ASSERT_TRUE(validateConfig(config, &error)) << error.toStdString();

    FakeLightEndpoint endpoint;
    LightController controller(config, &endpoint);

    controller.stepBrightness(Direction::Up);
    EXPECT_EQ(controller.state().brightness, 100);
    controller.stepBrightness(Direction::Down);
    EXPECT_EQ(controller.state().brightness, 3);
    controller.stepBrightness(Direction::Down);
    EXPECT_EQ(controller.state().brightness, 3);

    controller.stepTemperature(Direction::Down);
    EXPECT_EQ(controller.state().temperature, 143);
    controller.stepTemperature(Direction::Up);
    EXPECT_EQ(controller.state().temperature, 344);
    controller.stepTemperature(Direction::Up);
    EXPECT_EQ(controller.state().temperature, 344);

    ASSERT_TRUE(waitFor([&]() { return endpoint.sent.size() == 1; }));
    EXPECT_EQ(endpoint.sent.back().brightness, 3);
    EXPECT_EQ(endpoint.sent.back().temperature, 344);
}

TEST(LightControllerTest, BrightnessStaysAtMaximum)
{
    ControllerConfig config = testConfig();
    config.initialBrightness = 100;
    FakeLightEndpoint endpoint;
    LightController controller(config, &endpoint);

    controller.stepBrightness(Direction::Up);
    EXPECT_EQ(controller.state().brightness, 100);
}

TEST(LightControllerTest, BrightnessStaysAtMinimum)
{
    ControllerConfig config = testConfig();
    config.initialBrightness = 3;
    FakeLightEndpoint endpoint;
    LightController controller(config, &endpoint);

    controller.stepBrightness(Direction::Down);
    EXPECT_EQ(controller.state().brightness, 3);
}

TEST(LightControllerTest, StepsClampInsteadOfOvershooting)
{
    ControllerConfig config = testConfig();
    config.initialBrightness = 98;
    config.initialTemperature = 148;
    FakeLightEndpoint endpoint;
    LightController controller(config, &endpoint);

    controller.stepBrightness(Direction::Up);
    controller.stepTemperature(Direction::Down);

    EXPECT_EQ(controller.state().brightness, 100);
    EXPECT_EQ(controller.state().temperature, 143);
}

TEST(LightControllerTest, MixedStepSequencesStayInBounds)
{
    FakeLightEndpoint endpoint;
    LightController controller(testConfig(), &endpoint);

    unsigned seed = 12345;
    for (int i = 0; i < 500; ++i) {
        seed = seed * 1103515245u + 12345u;
        const Direction direction = (seed >> 16) & 1 ? Direction::Up : Direction::Down;
        if ((seed >> 17) & 1)
            controller.stepBrightness(direction);
        else
            controller.stepTemperature(direction);

        ASSERT_GE(controller.state().brightness, 3);
        ASSERT_LE(controller.state().brightness, 100);
        ASSERT_GE(controller.state().temperature, 143);
        ASSERT_LE(controller.state().temperature, 344);
    }

    for (int i = 0; i < 50; ++i)
        controller.stepBrightness(Direction::Up);
    EXPECT_EQ(controller.state().brightness, 100);
    for (int i = 0; i < 50; ++i)
        controller.stepTemperature(Direction::Down);
    EXPECT_EQ(controller.state().temperature, 143);
}

TEST(LightControllerTest, UnknownDirectionIsIgnored)
{
    FakeLightEndpoint endpoint;
    LightController controller(testConfig(), &endpoint);
    int changes = 0;
    QObject::connect(&controller, &LightController::stateChanged, [&changes]() { ++changes; });

    const LightState before = controller.state();
    controller.stepBrightness(QStringLiteral("sideways"));
    controller.stepTemperature(QStringLiteral(""));

    EXPECT_EQ(controller.state(), before);
    EXPECT_FALSE(controller.isSyncPending());
    pumpEvents(100);
    EXPECT_TRUE(endpoint.sent.empty());
    EXPECT_EQ(changes, 0);
}

TEST(LightControllerTest, DirectionTokensAreAccepted)
{
    FakeLightEndpoint endpoint;
    LightController controller(testConfig(), &endpoint);

    controller.stepBrightness(QStringLiteral("up"));
    controller.stepTemperature(QStringLiteral(" DOWN "));

    EXPECT_EQ(controller.state().brightness, 55);
    EXPECT_EQ(controller.state().temperature, 160);
}

TEST(LightControllerTest, BurstCollapsesIntoOneUpdateWithFinalState)
{
    FakeLightEndpoint endpoint;
    LightController controller(testConfig(150), &endpoint);

    for (int i = 0; i < 6; ++i) {
        controller.stepBrightness(Direction::Up);
        pumpEvents(20);
    }
    controller.stepTemperature(Direction::Up);

    EXPECT_TRUE(endpoint.sent.empty());
    ASSERT_TRUE(waitFor([&]() { return !endpoint.sent.empty(); }));
    pumpEvents(250);

    ASSERT_EQ(endpoint.sent.size(), 1u);
    EXPECT_EQ(endpoint.sent.front().brightness, 80);
    EXPECT_EQ(endpoint.sent.front().temperature, 180);
    EXPECT_FALSE(controller.isSyncPending());
}

TEST(LightControllerTest, SeparatedStepsEachSynchronize)
{
    FakeLightEndpoint endpoint;
    LightController controller(testConfig(30), &endpoint);

    controller.stepBrightness(Direction::Down);
    ASSERT_TRUE(waitFor([&]() { return endpoint.sent.size() == 1; }));
    controller.stepBrightness(Direction::Down);
    ASSERT_TRUE(waitFor([&]() { return endpoint.sent.size() == 2; }));

    EXPECT_EQ(endpoint.sent[0].brightness, 45);
    EXPECT_EQ(endpoint.sent[1].brightness, 40);
}

TEST(LightControllerTest, ToggleSendsImmediately)
{
    FakeLightEndpoint endpoint;
    LightController controller(testConfig(), &endpoint);

    controller.togglePower();

    ASSERT_EQ(endpoint.sent.size(), 1u);
    EXPECT_TRUE(endpoint.sent.front().on);
    EXPECT_TRUE(controller.state().on);

    controller.togglePower();
    ASSERT_EQ(endpoint.sent.size(), 2u);
    EXPECT_FALSE(endpoint.sent.back().on);
}

TEST(LightControllerTest, ToggleLeavesPendingStepArmed)
{
    FakeLightEndpoint endpoint;
    LightController controller(testConfig(80), &endpoint);

    controller.stepBrightness(Direction::Up);
    ASSERT_TRUE(controller.isSyncPending());

    controller.togglePower();
    ASSERT_EQ(endpoint.sent.size(), 1u);
    EXPECT_TRUE(endpoint.sent[0].on);
    EXPECT_EQ(endpoint.sent[0].brightness, 55);
    EXPECT_TRUE(controller.isSyncPending());

    ASSERT_TRUE(waitFor([&]() { return endpoint.sent.size() == 2; }));
    EXPECT_TRUE(endpoint.sent[1].on);
    EXPECT_EQ(endpoint.sent[1].brightness, 55);
    EXPECT_FALSE(controller.isSyncPending());
}

TEST(LightControllerTest, FailedSyncKeepsStateAndNextIntentRetries)
{
    FakeLightEndpoint endpoint;
    endpoint.failuresRemaining = 1;
    LightController controller(testConfig(20), &endpoint);
    QStringList failures;
    QObject::connect(&controller, &LightController::synchronizationFailed,
                     [&failures](const QString &error) { failures << error; });

    controller.togglePower();
    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures.front(), QStringLiteral("Connection refused"));
    EXPECT_TRUE(controller.state().on);
    EXPECT_EQ(controller.state().brightness, 50);
    EXPECT_FALSE(controller.isSyncInFlight());

    int successes = 0;
    QObject::connect(&controller, &LightController::synchronized, [&successes]() { ++successes; });
    controller.stepBrightness(Direction::Up);
    ASSERT_TRUE(waitFor([&]() { return endpoint.sent.size() == 2; }));

    EXPECT_EQ(successes, 1);
    EXPECT_EQ(failures.size(), 1);
    EXPECT_TRUE(endpoint.sent.back().on);
    EXPECT_EQ(endpoint.sent.back().brightness, 55);
}

TEST(LightControllerTest, FailedDebouncedSyncReturnsToIdle)
{
    FakeLightEndpoint endpoint;
    endpoint.failuresRemaining = 1;
    LightController controller(testConfig(20), &endpoint);

    controller.stepTemperature(Direction::Up);
    ASSERT_TRUE(waitFor([&]() { return endpoint.sent.size() == 1; }));
    EXPECT_FALSE(controller.isSyncPending());
    EXPECT_EQ(controller.state().temperature, 180);

    controller.stepTemperature(Direction::Up);
    ASSERT_TRUE(waitFor([&]() { return endpoint.sent.size() == 2; }));
    EXPECT_EQ(endpoint.sent.back().temperature, 190);
}

TEST(LightControllerTest, RepeatedSynchronizeSendsIdenticalPayloads)
{
    FakeLightEndpoint endpoint;
    LightController controller(testConfig(), &endpoint);

    controller.synchronizeNow();
    controller.synchronizeNow();

    ASSERT_EQ(endpoint.payloads.size(), 2u);
    EXPECT_EQ(endpoint.payloads[0], endpoint.payloads[1]);
}

TEST(LightControllerTest, RequestsNeverOverlap)
{
    FakeLightEndpoint endpoint;
    endpoint.deferCompletion = true;
    LightController controller(testConfig(), &endpoint);

    controller.togglePower();
    controller.togglePower();
    controller.togglePower();

    ASSERT_EQ(endpoint.sent.size(), 1u);
    EXPECT_TRUE(controller.isSyncInFlight());

    SyncResult ok;
    ok.ok = true;
    endpoint.completeOldest(ok);

    // One follow-up with the latest state, not one per queued toggle.
    ASSERT_EQ(endpoint.sent.size(), 2u);
    EXPECT_TRUE(endpoint.sent.back().on);
    endpoint.completeOldest(ok);
    EXPECT_FALSE(controller.isSyncInFlight());
    EXPECT_EQ(endpoint.sent.size(), 2u);
}

TEST(LightControllerTest, FlushSendsPendingStepRightAway)
{
    FakeLightEndpoint endpoint;
    LightController controller(testConfig(10000), &endpoint);

    EXPECT_FALSE(controller.flushPending());
    controller.stepBrightness(Direction::Up);
    EXPECT_TRUE(controller.flushPending());

    ASSERT_EQ(endpoint.sent.size(), 1u);
    EXPECT_EQ(endpoint.sent.front().brightness, 55);
    EXPECT_FALSE(controller.isSyncPending());
}

TEST(LightControllerTest, MissingEndpointReportsFailure)
{
    LightController controller(testConfig(), nullptr);
    QStringList failures;
    QObject::connect(&controller, &LightController::synchronizationFailed,
                     [&failures](const QString &error) { failures << error; });

    controller.togglePower();

    EXPECT_EQ(failures.size(), 1);
    EXPECT_TRUE(controller.state().on);
}

} // namespace
} // namespace keylight
