#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "trader/config_loader/config_loader.hpp"

using IntradayTrader::Config::SystemConfig;

namespace {

FeedConfig make_feed_config(const std::string& feed_name, const std::string& interval) {
    FeedConfig feed_config;
    feed_config.name = feed_name;
    feed_config.symbol = "SOXL";
    feed_config.interval = interval;
    return feed_config;
}

SystemConfig make_valid_config() {
    SystemConfig config;
    config.data.feeds.push_back(make_feed_config("soxl", "1m"));
    config.orders.tracked_instruments = {"SOXL-USD-SPOT"};
    config.strategy.quote_feed_name = "soxl";
    config.strategy.quote_instrument = "SOXL-USD-SPOT";
    return config;
}

} // anonymous namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        scratch_directory = std::filesystem::temp_directory_path() /
                            ("intraday_config_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(scratch_directory);
    }

    void TearDown() override {
        std::filesystem::remove_all(scratch_directory);
        unsetenv("INTRADAY_BROKER_API_KEY");
        unsetenv("INTRADAY_BROKER_API_SECRET");
    }

    std::string write_csv(const std::string& file_name, const std::string& csv_contents) {
        std::filesystem::path csv_path = scratch_directory / file_name;
        std::ofstream csv_stream(csv_path);
        csv_stream << csv_contents;
        return csv_path.string();
    }

    std::filesystem::path scratch_directory;
};

TEST_F(ConfigLoaderTest, ReadsFeedsListsAndScalars) {
    std::string csv_path = write_csv("data_config.csv",
        "# comment\n"
        "\n"
        "feed.soxl.symbol,SOXL\n"
        "feed.soxl.interval,1m\n"
        "feed.soxs.symbol, SOXS \n"
        "feed.soxs.interval,5m\n"
        "feed.soxs.period,2d\n"
        "orders.tracked_instruments,SOXL-USD-SPOT; SOXS-USD-SPOT\n"
        "timing.action_window_buffer_seconds,15\n"
        "data.enable_ssl_verification,false\n");

    SystemConfig config;
    ASSERT_TRUE(load_config_from_csv(config, csv_path));

    ASSERT_EQ(config.data.feeds.size(), 2u);
    EXPECT_EQ(config.data.feeds[0].name, "soxl");
    EXPECT_EQ(config.data.feeds[0].period, "max");
    EXPECT_EQ(config.data.feeds[1].symbol, "SOXS");
    EXPECT_EQ(config.data.feeds[1].interval, "5m");
    EXPECT_EQ(config.data.feeds[1].period, "2d");
    EXPECT_EQ(config.orders.tracked_instruments, (std::vector<std::string>{"SOXL-USD-SPOT", "SOXS-USD-SPOT"}));
    EXPECT_EQ(config.timing.action_window_buffer_seconds, 15);
    EXPECT_FALSE(config.data.enable_ssl_verification);
}

TEST_F(ConfigLoaderTest, ReadsConnectivityPolicyPerChannel) {
    std::string csv_path = write_csv("broker_config.csv",
        "broker.connectivity.degraded_after_failures,2\n"
        "broker.connectivity.max_backoff_seconds,15\n"
        "data.connectivity.backoff_multiplier,3.0\n");

    SystemConfig config;
    ASSERT_TRUE(load_config_from_csv(config, csv_path));
    EXPECT_EQ(config.broker.connectivity.degraded_after_failures, 2);
    EXPECT_EQ(config.broker.connectivity.max_backoff_seconds, 15);
    EXPECT_DOUBLE_EQ(config.data.connectivity.backoff_multiplier, 3.0);
    EXPECT_EQ(config.data.connectivity.degraded_after_failures, 3);
}

TEST_F(ConfigLoaderTest, UnknownKeyIsOnlyAWarning) {
    std::string csv_path = write_csv("timing_config.csv", "timing.not_a_real_setting,5\ntiming.stale_data_backoff_seconds,40\n");
    SystemConfig config;
    EXPECT_TRUE(load_config_from_csv(config, csv_path));
    EXPECT_EQ(config.timing.stale_data_backoff_seconds, 40);
}

TEST_F(ConfigLoaderTest, UnparsableValueFailsLoad) {
    std::string csv_path = write_csv("timing_config.csv", "timing.loop_poll_interval_milliseconds,fast\n");
    SystemConfig config;
    EXPECT_FALSE(load_config_from_csv(config, csv_path));
}

TEST_F(ConfigLoaderTest, UnknownFeedFieldFailsLoad) {
    std::string csv_path = write_csv("data_config.csv", "feed.soxl.colour,red\n");
    SystemConfig config;
    EXPECT_FALSE(load_config_from_csv(config, csv_path));
}

TEST_F(ConfigLoaderTest, MissingFileFailsLoad) {
    SystemConfig config;
    EXPECT_FALSE(load_config_from_csv(config, (scratch_directory / "absent.csv").string()));
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesCredentials) {
    SystemConfig config;
    config.broker.api_key = "from-csv";
    setenv("INTRADAY_BROKER_API_KEY", "from-env", 1);
    apply_environment_overrides(config);
    EXPECT_EQ(config.broker.api_key, "from-env");
    EXPECT_TRUE(config.broker.api_secret.empty());
}

TEST_F(ConfigLoaderTest, ShippedConfigurationLoads) {
    SystemConfig config;
    ASSERT_EQ(load_system_config(config, INTRADAY_TRADER_CONFIG_DIR), 0);
    EXPECT_EQ(config.broker.mode, "paper");
    EXPECT_EQ(config.data.feeds.size(), 2u);
    EXPECT_EQ(config.strategy.hedge_feed_name, "soxs");
    EXPECT_EQ(config.timing.end_of_day_hour_utc, 20);
    EXPECT_EQ(config.timing.end_of_day_minute_utc, 59);
    EXPECT_EQ(config.broker.connectivity.disconnected_after_failures, 4);
    EXPECT_EQ(config.data.connectivity.disconnected_after_failures, 6);
}

TEST_F(ConfigLoaderTest, MissingDirectoryFailsSystemLoad) {
    SystemConfig config;
    EXPECT_NE(load_system_config(config, (scratch_directory / "nowhere").string()), 0);
}

TEST(ValidateConfigTest, AcceptsMinimalConfiguration) {
    std::string error_message;
    EXPECT_TRUE(validate_config(make_valid_config(), error_message)) << error_message;
}

TEST(ValidateConfigTest, RejectsWindowBeyondOneMinute) {
    SystemConfig config = make_valid_config();
    config.timing.action_window_buffer_seconds = 60;
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("action_window_buffer_seconds"), std::string::npos);
}

TEST(ValidateConfigTest, RejectsEndOfDayOutOfRange) {
    SystemConfig config = make_valid_config();
    config.timing.end_of_day_hour_utc = 24;
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST(ValidateConfigTest, RejectsMissingFeeds) {
    SystemConfig config = make_valid_config();
    config.data.feeds.clear();
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST(ValidateConfigTest, RejectsBadFeedInterval) {
    SystemConfig config = make_valid_config();
    config.data.feeds.push_back(make_feed_config("bad", "3x"));
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("bad"), std::string::npos);
}

TEST(ValidateConfigTest, RejectsMalformedTrackedInstrument) {
    SystemConfig config = make_valid_config();
    config.orders.tracked_instruments = {"SOXL-USD"};
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST(ValidateConfigTest, RejectsUnknownBrokerMode) {
    SystemConfig config = make_valid_config();
    config.broker.mode = "ib";
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST(ValidateConfigTest, RejectsHedgeFeedWithoutInstrument) {
    SystemConfig config = make_valid_config();
    config.strategy.hedge_feed_name = "soxs";
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST(ValidateConfigTest, RejectsCashUtilizationAboveOne) {
    SystemConfig config = make_valid_config();
    config.strategy.cash_utilization = 1.5;
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST(ValidateConfigTest, RejectsInvertedConnectivityThresholds) {
    SystemConfig config = make_valid_config();
    config.broker.connectivity.disconnected_after_failures = config.broker.connectivity.degraded_after_failures;
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("broker.connectivity"), std::string::npos);
}

TEST(ValidateConfigTest, RejectsZeroIntervalFeed) {
    SystemConfig config = make_valid_config();
    config.data.feeds.push_back(make_feed_config("frozen", "0m"));
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
}
