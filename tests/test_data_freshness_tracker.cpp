#include <gtest/gtest.h>
#include <stdexcept>
#include "trader/market_data/data_freshness_tracker.hpp"
#include "utils/time_utils.hpp"
#include "mocks/mock_data_grabber.hpp"

using namespace IntradayTrader::Core;
using IntradayTrader::Logging::LoggingContext;
using IntradayTrader::Tests::MockDataGrabber;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

Bar make_bar(TimePoint timestamp, double close_price) {
    Bar bar;
    bar.timestamp = timestamp;
    bar.open_price = close_price;
    bar.high_price = close_price;
    bar.low_price = close_price;
    bar.close_price = close_price;
    bar.volume = 1000.0;
    return bar;
}

} // anonymous namespace

class DataFreshnessTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_grabber = std::make_shared<MockDataGrabber>();
        feed.name = "soxl";
        feed.symbol = "SOXL";
        feed.interval = "1m";
        feed.period = "1d";
        feed.interval_seconds = 60;
        feed.last_update_timestamp = initial_feed_timestamp();
        feed.data_grabber = data_grabber;
        now = TimeUtils::make_utc_time_point(2024, 3, 4, 15, 30, 5);
    }

    LoggingContext logging_context;
    std::shared_ptr<MockDataGrabber> data_grabber;
    Feed feed;
    TimePoint now;
};

TEST_F(DataFreshnessTrackerTest, RecentFeedIsUpToDateWithoutFetching) {
    feed.last_update_timestamp = now - std::chrono::seconds(30);
    EXPECT_CALL(*data_grabber, fetch_historical(_)).Times(0);

    DataFreshnessTracker tracker(logging_context);
    EXPECT_EQ(tracker.classify(feed, now), FreshnessResult::UP_TO_DATE);
}

TEST_F(DataFreshnessTrackerTest, FreshFetchIsUpdatedAndAdvancesTimestamp) {
    TimePoint newest_bar_time = now - std::chrono::seconds(5);
    BarTable fetched_bars = {make_bar(newest_bar_time - std::chrono::minutes(1), 10.0), make_bar(newest_bar_time, 10.5)};
    EXPECT_CALL(*data_grabber, fetch_historical(_)).WillOnce(Return(fetched_bars));

    DataFreshnessTracker tracker(logging_context);
    EXPECT_EQ(tracker.classify(feed, now), FreshnessResult::UPDATED);
    EXPECT_EQ(feed.last_update_timestamp, newest_bar_time);
    EXPECT_EQ(feed.data.size(), 2u);
}

TEST_F(DataFreshnessTrackerTest, OneIntervalBehindIsUpdatedButLate) {
    TimePoint newest_bar_time = now - std::chrono::seconds(65);
    EXPECT_CALL(*data_grabber, fetch_historical(_)).WillOnce(Return(BarTable{make_bar(newest_bar_time, 10.0)}));

    DataFreshnessTracker tracker(logging_context);
    EXPECT_EQ(tracker.classify(feed, now), FreshnessResult::UPDATED_BUT_LATE);
    EXPECT_EQ(feed.last_update_timestamp, newest_bar_time);
}

TEST_F(DataFreshnessTrackerTest, TwoIntervalsBehindIsStale) {
    TimePoint newest_bar_time = now - std::chrono::seconds(120);
    EXPECT_CALL(*data_grabber, fetch_historical(_)).WillOnce(Return(BarTable{make_bar(newest_bar_time, 10.0)}));

    DataFreshnessTracker tracker(logging_context);
    EXPECT_EQ(tracker.classify(feed, now), FreshnessResult::STALE);
}

TEST_F(DataFreshnessTrackerTest, EmptyFetchIsErrorAndKeepsState) {
    TimePoint previous_timestamp = feed.last_update_timestamp;
    EXPECT_CALL(*data_grabber, fetch_historical(_)).WillOnce(Return(BarTable{}));

    DataFreshnessTracker tracker(logging_context);
    EXPECT_EQ(tracker.classify(feed, now), FreshnessResult::FETCH_ERROR);
    EXPECT_EQ(feed.last_update_timestamp, previous_timestamp);
}

TEST_F(DataFreshnessTrackerTest, ThrowingFetchIsError) {
    EXPECT_CALL(*data_grabber, fetch_historical(_)).WillOnce(Throw(std::runtime_error("timeout")));

    DataFreshnessTracker tracker(logging_context);
    EXPECT_EQ(tracker.classify(feed, now), FreshnessResult::FETCH_ERROR);
}

TEST_F(DataFreshnessTrackerTest, RequestCarriesFeedParameters) {
    HistoricalDataRequest captured_request;
    EXPECT_CALL(*data_grabber, fetch_historical(_))
        .WillOnce(::testing::DoAll(::testing::SaveArg<0>(&captured_request), Return(BarTable{make_bar(now, 1.0)})));

    DataFreshnessTracker tracker(logging_context);
    tracker.classify(feed, now);
    EXPECT_EQ(captured_request.symbol, "SOXL");
    EXPECT_EQ(captured_request.interval, "1m");
    EXPECT_EQ(captured_request.period, "1d");
}
