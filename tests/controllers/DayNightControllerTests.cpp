/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file DayNightControllerTests.cpp
 * @brief Tests for the day/night cycle clock and the signals it emits
 */

#define BOOST_TEST_MODULE DayNightControllerTests
#include <boost/test/unit_test.hpp>

#include "controllers/world/DayNightController.hpp"
#include <limits>
#include <stdexcept>
#include <string>

using namespace Nightfall;

struct DayNightFixture {
    DayNightConfig config;
    DayNightController controller{config};
    DayNightSignals signals;

    // Step the clock in small increments up to a total time
    void advanceTo(float target, float step = 0.01f) {
        float t = 0.0f;
        while (t + step < target) {
            controller.update(step, signals);
            t += step;
        }
        controller.update(target - t, signals);
    }
};

BOOST_FIXTURE_TEST_SUITE(DayNightCycleTests, DayNightFixture)

BOOST_AUTO_TEST_CASE(StartsAtDawn) {
    BOOST_CHECK(controller.getCurrentPhase() == DayPhase::Day);
    BOOST_CHECK(!controller.isNight());
    BOOST_CHECK_EQUAL(std::string(controller.getCurrentPhaseString()), "Day");
    BOOST_CHECK_EQUAL(controller.getCycleTime(), 0.0f);
}

BOOST_AUTO_TEST_CASE(NoSignalsDuringDay) {
    controller.update(19.5f, signals);
    BOOST_CHECK(signals.empty());
    BOOST_CHECK(controller.getCurrentPhase() == DayPhase::Day);
}

BOOST_AUTO_TEST_CASE(NightBeginsAfterDayLength) {
    controller.update(19.9f, signals);
    controller.update(0.2f, signals);

    BOOST_REQUIRE_EQUAL(signals.size(), 1u);
    BOOST_CHECK(signals[0] == DayNightSignal::NIGHT_BEGIN);
    BOOST_CHECK(controller.getCurrentPhase() == DayPhase::NightHalt);
    BOOST_CHECK(controller.isNight());
}

BOOST_AUTO_TEST_CASE(ReachingBoundaryExactlyCrossesIt) {
    controller.update(20.0f, signals);
    BOOST_REQUIRE_EQUAL(signals.size(), 1u);
    BOOST_CHECK(signals[0] == DayNightSignal::NIGHT_BEGIN);
}

BOOST_AUTO_TEST_CASE(HaltWindowThenFleeThenDay) {
    advanceTo(20.3f);
    BOOST_REQUIRE_EQUAL(signals.size(), 1u);

    controller.update(0.3f, signals); // past 20.56
    BOOST_REQUIRE_EQUAL(signals.size(), 2u);
    BOOST_CHECK(signals[1] == DayNightSignal::HALT_WINDOW_ELAPSED);
    BOOST_CHECK(controller.getCurrentPhase() == DayPhase::NightFlee);

    controller.update(11.5f, signals); // past 32
    BOOST_REQUIRE_EQUAL(signals.size(), 3u);
    BOOST_CHECK(signals[2] == DayNightSignal::DAY_BEGIN);
    BOOST_CHECK(controller.getCurrentPhase() == DayPhase::Day);
    BOOST_CHECK_EQUAL(controller.getCompletedCycles(), 1u);
    BOOST_CHECK_CLOSE(controller.getCycleTime(), 0.1f, 1.0f);
}

BOOST_AUTO_TEST_CASE(LargeStepEmitsEverySignalInOrder) {
    // Two full cycles and a bit: 2 * 32 + 21 = 85 seconds
    controller.update(85.0f, signals);

    BOOST_REQUIRE_EQUAL(signals.size(), 8u);
    for (size_t cycle = 0; cycle < 2; ++cycle) {
        BOOST_CHECK(signals[cycle * 3 + 0] == DayNightSignal::NIGHT_BEGIN);
        BOOST_CHECK(signals[cycle * 3 + 1] == DayNightSignal::HALT_WINDOW_ELAPSED);
        BOOST_CHECK(signals[cycle * 3 + 2] == DayNightSignal::DAY_BEGIN);
    }
    BOOST_CHECK(signals[6] == DayNightSignal::NIGHT_BEGIN);
    BOOST_CHECK(signals[7] == DayNightSignal::HALT_WINDOW_ELAPSED);
    BOOST_CHECK_EQUAL(controller.getCompletedCycles(), 2u);
}

BOOST_AUTO_TEST_CASE(LargeStepDoesNotHang) {
    // 31250 whole cycles plus 5 seconds of day
    controller.update(1.0e6f + 5.0f, signals);
    BOOST_CHECK_EQUAL(signals.size(), 6u);
    BOOST_CHECK_EQUAL(controller.getCompletedCycles(), 31250u);
    BOOST_CHECK(controller.getCurrentPhase() == DayPhase::Day);
    BOOST_CHECK_CLOSE(controller.getCycleTime(), 5.0f, 0.1f);

    // Every phase length is below half a float ULP of 1e9
    signals.clear();
    controller.update(1.0e9f, signals);
    BOOST_REQUIRE_EQUAL(signals.size(), 6u);
    BOOST_CHECK(signals[0] == DayNightSignal::NIGHT_BEGIN);
    BOOST_CHECK(signals[5] == DayNightSignal::DAY_BEGIN);
    BOOST_CHECK_EQUAL(controller.getCompletedCycles(), 31250u + 31250000u);
    BOOST_CHECK(controller.getCurrentPhase() == DayPhase::Day);
}

BOOST_AUTO_TEST_CASE(LargeStepKeepsPhaseWithinCycle) {
    controller.update(10.0f, signals);
    // 1000 whole cycles plus 15 seconds lands at 25 seconds, in the flee part of the night
    controller.update(32000.0f + 15.0f, signals);
    BOOST_CHECK(controller.getCurrentPhase() == DayPhase::NightFlee);
    BOOST_CHECK_CLOSE(controller.getCycleTime(), 25.0f, 0.1f);
    BOOST_CHECK_EQUAL(controller.getCompletedCycles(), 1000u);
    BOOST_CHECK(signals.back() == DayNightSignal::HALT_WINDOW_ELAPSED);
}

BOOST_AUTO_TEST_CASE(NonFiniteStepIsIgnored) {
    controller.update(std::numeric_limits<float>::infinity(), signals);
    controller.update(std::numeric_limits<float>::quiet_NaN(), signals);
    BOOST_CHECK(signals.empty());
    BOOST_CHECK_EQUAL(controller.getCycleTime(), 0.0f);
}

BOOST_AUTO_TEST_CASE(SmallStepsMatchLargeStep) {
    advanceTo(85.0f, 1.0f / 60.0f);
    BOOST_CHECK_EQUAL(signals.size(), 8u);
    BOOST_CHECK(controller.getCurrentPhase() == DayPhase::NightFlee);
}

BOOST_AUTO_TEST_CASE(NonPositiveStepIsIgnored) {
    controller.update(0.0f, signals);
    controller.update(-5.0f, signals);
    BOOST_CHECK(signals.empty());
    BOOST_CHECK_EQUAL(controller.getCycleTime(), 0.0f);
}

BOOST_AUTO_TEST_CASE(ResetReturnsToDawn) {
    controller.update(40.0f, signals);
    controller.reset();
    BOOST_CHECK(controller.getCurrentPhase() == DayPhase::Day);
    BOOST_CHECK_EQUAL(controller.getCompletedCycles(), 0u);
    BOOST_CHECK_EQUAL(controller.getCycleTime(), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(DayNightConfigTests)

BOOST_AUTO_TEST_CASE(ZeroHaltWindowEmitsBothNightSignals) {
    DayNightConfig config;
    config.haltWindow = 0.0f;
    DayNightController controller(config);
    DayNightSignals signals;

    controller.update(20.0f, signals);
    BOOST_REQUIRE_EQUAL(signals.size(), 2u);
    BOOST_CHECK(signals[0] == DayNightSignal::NIGHT_BEGIN);
    BOOST_CHECK(signals[1] == DayNightSignal::HALT_WINDOW_ELAPSED);
}

BOOST_AUTO_TEST_CASE(InvalidLengthsThrow) {
    DayNightConfig config;
    config.dayLength = 0.0f;
    BOOST_CHECK_THROW(DayNightController{config}, std::invalid_argument);

    config = DayNightConfig{};
    config.haltWindow = config.nightLength + 1.0f;
    BOOST_CHECK_THROW(DayNightController{config}, std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
