#include <gtest/gtest.h>
#include <stdexcept>
#include "api/yahoo/yahoo_finance_grabber.hpp"
#include "utils/time_utils.hpp"

using namespace IntradayTrader::Core;
using IntradayTrader::API::YahooFinanceGrabber;

TEST(YahooFinanceGrabberTest, MaxPeriodIsCappedPerInterval) {
    EXPECT_EQ(YahooFinanceGrabber::resolve_period("1m", "max"), "7d");
    EXPECT_EQ(YahooFinanceGrabber::resolve_period("2m", "max"), "7d");
    EXPECT_EQ(YahooFinanceGrabber::resolve_period("15m", "max"), "60d");
    EXPECT_EQ(YahooFinanceGrabber::resolve_period("90m", "max"), "60d");
    EXPECT_EQ(YahooFinanceGrabber::resolve_period("1h", "max"), "730d");
    EXPECT_EQ(YahooFinanceGrabber::resolve_period("60m", "max"), "730d");
}

TEST(YahooFinanceGrabberTest, ExplicitOrDailyPeriodIsKept) {
    EXPECT_EQ(YahooFinanceGrabber::resolve_period("1m", "2d"), "2d");
    EXPECT_EQ(YahooFinanceGrabber::resolve_period("1d", "max"), "max");
}

TEST(YahooFinanceGrabberTest, ParsesChartAndSkipsNullRows) {
    const std::string response_body = R"({
        "chart": {
            "result": [{
                "timestamp": [1709566200, 1709566260, 1709566320],
                "indicators": {
                    "quote": [{
                        "open":   [30.1, null, 30.4],
                        "high":   [30.5, 30.6, 30.9],
                        "low":    [30.0, 30.2, 30.3],
                        "close":  [30.2, 30.5, 30.8],
                        "volume": [1200, 900, 1500]
                    }]
                }
            }],
            "error": null
        }
    })";

    BarTable bars = YahooFinanceGrabber::parse_chart_response(response_body);

    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].timestamp, TimeUtils::from_unix_seconds(1709566200));
    EXPECT_DOUBLE_EQ(bars[0].close_price, 30.2);
    EXPECT_EQ(bars[1].timestamp, TimeUtils::from_unix_seconds(1709566320));
    EXPECT_DOUBLE_EQ(bars[1].high_price, 30.9);
    EXPECT_DOUBLE_EQ(bars[1].volume, 1500.0);
}

TEST(YahooFinanceGrabberTest, EmptyResultIsEmptyTable) {
    EXPECT_TRUE(YahooFinanceGrabber::parse_chart_response(R"({"chart": {"result": [], "error": null}})").empty());
    EXPECT_TRUE(YahooFinanceGrabber::parse_chart_response("").empty());
}

TEST(YahooFinanceGrabberTest, ChartErrorThrows) {
    const std::string response_body =
        R"({"chart": {"result": null, "error": {"code": "Not Found", "description": "No data found, symbol may be delisted"}}})";
    EXPECT_THROW(YahooFinanceGrabber::parse_chart_response(response_body), std::runtime_error);
}

TEST(YahooFinanceGrabberTest, MalformedJsonThrows) {
    EXPECT_THROW(YahooFinanceGrabber::parse_chart_response("{not json"), std::runtime_error);
}
