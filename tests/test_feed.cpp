#include <gtest/gtest.h>
#include "trader/errors/trading_errors.hpp"
#include "trader/market_data/feed.hpp"
#include "mocks/mock_data_grabber.hpp"

using namespace IntradayTrader::Core;
using IntradayTrader::Tests::MockDataGrabber;

TEST(IntervalToSecondsTest, ConvertsEveryUnit) {
    EXPECT_EQ(interval_to_seconds("30s"), 30);
    EXPECT_EQ(interval_to_seconds("1m"), 60);
    EXPECT_EQ(interval_to_seconds("2h"), 7200);
    EXPECT_EQ(interval_to_seconds("3d"), 259200);
    EXPECT_EQ(interval_to_seconds("1w"), 604800);
    EXPECT_EQ(interval_to_seconds("1M"), 2592000);
    EXPECT_EQ(interval_to_seconds("1y"), 31536000);
}

TEST(IntervalToSecondsTest, RejectsMalformedText) {
    EXPECT_THROW(interval_to_seconds("3x"), InvalidIntervalFormat);
    EXPECT_THROW(interval_to_seconds("m"), InvalidIntervalFormat);
    EXPECT_THROW(interval_to_seconds(""), InvalidIntervalFormat);
    EXPECT_THROW(interval_to_seconds("-1m"), InvalidIntervalFormat);
    EXPECT_THROW(interval_to_seconds("1.5h"), InvalidIntervalFormat);
}

TEST(IntervalToSecondsTest, RejectsZeroCount) {
    EXPECT_THROW(interval_to_seconds("0m"), InvalidIntervalFormat);
    EXPECT_THROW(interval_to_seconds("00s"), InvalidIntervalFormat);
}

TEST(IntervalToSecondsTest, RejectsCountsThatOverflow) {
    EXPECT_THROW(interval_to_seconds("9223372036854775807y"), InvalidIntervalFormat);
    EXPECT_THROW(interval_to_seconds("99999999999999999999s"), InvalidIntervalFormat);
    EXPECT_EQ(interval_to_seconds("9223372036854775807s"), 9223372036854775807LL);
}

TEST(MakeFeedTest, StartsFromInitialTimestamp) {
    FeedConfig feed_config;
    feed_config.name = "soxl";
    feed_config.symbol = "SOXL";
    feed_config.interval = "1m";
    feed_config.period = "2d";

    auto data_grabber = std::make_shared<MockDataGrabber>();
    Feed feed = make_feed(feed_config, data_grabber);

    EXPECT_EQ(feed.name, "soxl");
    EXPECT_EQ(feed.symbol, "SOXL");
    EXPECT_EQ(feed.interval_seconds, 60);
    EXPECT_EQ(feed.last_update_timestamp, initial_feed_timestamp());
    EXPECT_TRUE(feed.data.empty());
    EXPECT_EQ(feed.data_grabber, data_grabber);
}

TEST(MakeFeedTest, FallsBackToSymbolAsName) {
    FeedConfig feed_config;
    feed_config.symbol = "SOXS";
    feed_config.interval = "5m";

    Feed feed = make_feed(feed_config, nullptr);
    EXPECT_EQ(feed.name, "SOXS");
    EXPECT_EQ(feed.period, "max");
}

TEST(MakeFeedTest, InvalidIntervalThrows) {
    FeedConfig feed_config;
    feed_config.symbol = "SOXL";
    feed_config.interval = "1q";
    EXPECT_THROW(make_feed(feed_config, nullptr), InvalidIntervalFormat);
}
