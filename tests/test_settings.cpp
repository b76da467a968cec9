#include <gtest/gtest.h>

#include <string>

#include "settings.hpp"


TEST(Settings, DefaultsAreValid) {
    const Settings settings {};
    std::string error;
    EXPECT_TRUE(validate_settings(settings, error)) << error;
    EXPECT_EQ(settings.publisher.port, DEFAULT_ZEROMQ_PORT);
    EXPECT_EQ(settings.parity.id_window_capacity, 1000u);
    EXPECT_EQ(settings.segments.min_segment_time_ms, 500);
    EXPECT_EQ(settings.roles.size(), 5u);
}

TEST(Settings, LoadOverridesOnlyGivenKeys) {
    Settings settings;
    std::string error;
    ASSERT_TRUE(load_settings(OPENPACE_TEST_DATA_DIR "/settings.yaml", settings, error)) << error;

    EXPECT_EQ(settings.parity.out_of_order_tolerance_ms, 250u);
    EXPECT_EQ(settings.parity.id_window_capacity, 64u);
    EXPECT_EQ(settings.parity.max_error_length, 200u);

    EXPECT_EQ(settings.segments.min_segment_time_ms, 300);
    EXPECT_EQ(settings.segments.max_segment_time_ms, 60000);
    EXPECT_EQ(settings.segments.history_capacity, 20u);

    EXPECT_FALSE(settings.roles.at("league").allowed);
    EXPECT_EQ(settings.roles.at("league").max_rate_hz, 2u);
    EXPECT_TRUE(settings.roles.at("steward").allowed);
    EXPECT_EQ(settings.roles.at("steward").max_rate_hz, 1u);
    EXPECT_EQ(settings.roles.at("driver").max_rate_hz, 10u);

    EXPECT_EQ(settings.publisher.port, 6000);
    EXPECT_EQ(settings.publisher.report_period_ms, static_cast<uint64_t>(REPORTING_PERIOD));
    EXPECT_EQ(settings.publisher.trend_period_ms, 2000u);
}

TEST(Settings, InvalidFileLeavesSettingsUntouched) {
    Settings settings;
    std::string error;
    EXPECT_FALSE(load_settings(OPENPACE_TEST_DATA_DIR "/bad_settings.yaml", settings, error));
    EXPECT_NE(error.find("min_segment_time_ms"), std::string::npos);
    EXPECT_EQ(settings.segments.min_segment_time_ms, 500);
}

TEST(Settings, MissingFile) {
    Settings settings;
    std::string error;
    EXPECT_FALSE(load_settings(OPENPACE_TEST_DATA_DIR "/no_such_settings.yaml", settings, error));
    EXPECT_FALSE(error.empty());
}

TEST(Settings, ValidationRules) {
    std::string error;
    Settings settings;
    settings.parity.id_window_capacity = 0;
    EXPECT_FALSE(validate_settings(settings, error));

    settings = Settings{};
    settings.publisher.port = 70000;
    EXPECT_FALSE(validate_settings(settings, error));

    settings = Settings{};
    settings.segments.history_capacity = 0;
    EXPECT_FALSE(validate_settings(settings, error));
}
