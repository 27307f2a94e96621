/**
 * @file config_tests.cpp
 * @brief Validation of FocusConfig.
 */

#include <arfocus/core/config.hpp>
#include <arfocus/core/error.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

using namespace arfocus::core;

TEST (ConfigTests, DefaultsMatchConstants)
{
    const FocusConfig cfg;
    EXPECT_NO_THROW (cfg.validate ());
    EXPECT_EQ (cfg.historyCapacity, POSITION_HISTORY_CAPACITY);
    EXPECT_EQ (cfg.orientationRefreshTicks, ORIENTATION_REFRESH_TICKS);
    EXPECT_DOUBLE_EQ (cfg.steepTiltThreshold, STEEP_TILT_THRESHOLD);
    EXPECT_EQ (cfg.updatePolicy, DetectionUpdatePolicy::EveryTick);
    EXPECT_EQ (cfg.logger, nullptr);
}

TEST (ConfigTests, RejectsInvalidFields)
{
    const auto expectInvalid = [] (auto mutate) {
        FocusConfig cfg;
        mutate (cfg);
        EXPECT_THROW (cfg.validate (), std::invalid_argument);
    };

    expectInvalid ([] (FocusConfig &c) { c.historyCapacity = 0; });
    expectInvalid ([] (FocusConfig &c) { c.nearScaleDistance = 0.0; });
    expectInvalid ([] (FocusConfig &c) { c.nearScaleDistance = std::numeric_limits<double>::infinity (); });
    expectInvalid ([] (FocusConfig &c) { c.farScaleSlope = -0.1; });
    expectInvalid ([] (FocusConfig &c) { c.farScaleOffset = std::numeric_limits<double>::quiet_NaN (); });
    expectInvalid ([] (FocusConfig &c) { c.steepTiltThreshold = 0.0; });
    expectInvalid ([] (FocusConfig &c) { c.steepTiltThreshold = 2.0; });
    expectInvalid ([] (FocusConfig &c) { c.orientationRefreshTicks = 0; });
    expectInvalid ([] (FocusConfig &c) { c.billboardDistance = -1.0; });
    expectInvalid ([] (FocusConfig &c) { c.visibilityFadeDuration = -0.1; });
    expectInvalid ([] (FocusConfig &c) { c.reorientationDuration = std::numeric_limits<double>::quiet_NaN (); });
}

TEST (ConfigTests, ErrorNames)
{
    EXPECT_EQ (toString (FocusError::AlreadyInitialized), "already initialized");
}
