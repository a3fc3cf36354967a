#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "api/alpaca/alpaca_broker.hpp"
#include "trader/errors/trading_errors.hpp"
#include "mocks/manual_clock_source.hpp"

using namespace IntradayTrader::Core;
using IntradayTrader::API::AlpacaBroker;
using IntradayTrader::API::BrokerStatusVocabulary;
using IntradayTrader::Logging::LoggingContext;
using json = nlohmann::json;

namespace {

OrderRequest make_request(OrderSide side, int quantity, OrderType order_type, TimeInForce time_in_force = TimeInForce::DAY) {
    OrderRequest order_request;
    order_request.instrument = Instrument("SOXL", "USD", TradeType::SPOT);
    order_request.side = side;
    order_request.quantity = quantity;
    order_request.order_type = order_type;
    order_request.time_in_force = time_in_force;
    return order_request;
}

} // anonymous namespace

TEST(AlpacaOrderBodyTest, MarketBuy) {
    json order_json = json::parse(AlpacaBroker::build_order_body(make_request(OrderSide::BUY, 50, OrderType::MARKET)));
    EXPECT_EQ(order_json["symbol"], "SOXL");
    EXPECT_EQ(order_json["qty"], "50");
    EXPECT_EQ(order_json["side"], "buy");
    EXPECT_EQ(order_json["type"], "market");
    EXPECT_EQ(order_json["time_in_force"], "day");
    EXPECT_FALSE(order_json.contains("limit_price"));
}

TEST(AlpacaOrderBodyTest, StopLimitCarriesBothPrices) {
    OrderRequest order_request = make_request(OrderSide::SELL, 5, OrderType::STOP_LIMIT, TimeInForce::GOOD_TILL_CANCEL);
    order_request.limit_price = 29.5;
    order_request.stop_price = 30.0;
    json order_json = json::parse(AlpacaBroker::build_order_body(order_request));
    EXPECT_EQ(order_json["side"], "sell");
    EXPECT_EQ(order_json["type"], "stop_limit");
    EXPECT_EQ(order_json["time_in_force"], "gtc");
    EXPECT_TRUE(order_json.contains("limit_price"));
    EXPECT_TRUE(order_json.contains("stop_price"));
}

TEST(AlpacaOrderBodyTest, TrailingStopUsesTrailPrice) {
    OrderRequest order_request = make_request(OrderSide::SELL, 5, OrderType::TRAILING);
    order_request.stop_price = 1.5;
    json order_json = json::parse(AlpacaBroker::build_order_body(order_request));
    EXPECT_EQ(order_json["type"], "trailing_stop");
    EXPECT_TRUE(order_json.contains("trail_price"));
    EXPECT_FALSE(order_json.contains("stop_price"));
}

TEST(AlpacaOrderBodyTest, OnCloseOrdersUseClosingAuction) {
    json market_on_close = json::parse(AlpacaBroker::build_order_body(make_request(OrderSide::BUY, 1, OrderType::MARKET_ON_CLOSE)));
    EXPECT_EQ(market_on_close["type"], "market");
    EXPECT_EQ(market_on_close["time_in_force"], "cls");

    OrderRequest limit_on_close_request = make_request(OrderSide::BUY, 1, OrderType::LIMIT_ON_CLOSE);
    limit_on_close_request.limit_price = 30.0;
    json limit_on_close = json::parse(AlpacaBroker::build_order_body(limit_on_close_request));
    EXPECT_EQ(limit_on_close["type"], "limit");
    EXPECT_EQ(limit_on_close["time_in_force"], "cls");
}

TEST(AlpacaOrderBodyTest, ExtendedHoursFlag) {
    json order_json = json::parse(AlpacaBroker::build_order_body(
        make_request(OrderSide::BUY, 1, OrderType::LIMIT, TimeInForce::GTC_EXTENDED)));
    EXPECT_EQ(order_json["time_in_force"], "gtc");
    EXPECT_EQ(order_json["extended_hours"], true);

    json opening_json = json::parse(AlpacaBroker::build_order_body(make_request(OrderSide::BUY, 1, OrderType::MARKET, TimeInForce::AM)));
    EXPECT_EQ(opening_json["time_in_force"], "opg");
}

TEST(AlpacaOrderBodyTest, PerpetualsAreRejected) {
    OrderRequest order_request = make_request(OrderSide::BUY, 1, OrderType::MARKET);
    order_request.instrument.trade_type = TradeType::PERP;
    EXPECT_THROW(AlpacaBroker::build_order_body(order_request), UnknownTradeType);
}

TEST(AlpacaOrderBodyTest, TrailingLimitIsUnsupported) {
    EXPECT_THROW(AlpacaBroker::build_order_body(make_request(OrderSide::BUY, 1, OrderType::TRAILING_LIMIT)), InvalidOrder);
}

class AlpacaBrokerTest : public ::testing::Test {
protected:
    AlpacaBrokerTest()
        : clock_source(std::chrono::system_clock::time_point(std::chrono::seconds(1709562600))),
          connectivity_manager("broker", broker_config.connectivity, clock_source) {}

    BrokerConfig broker_config;
    IntradayTrader::Tests::ManualClockSource clock_source;
    ConnectivityManager connectivity_manager;
    LoggingContext logging_context;
};

TEST_F(AlpacaBrokerTest, StartRequiresCredentials) {
    AlpacaBroker broker(broker_config, connectivity_manager, logging_context);
    EXPECT_THROW(broker.start(), SetupError);
}

TEST_F(AlpacaBrokerTest, RequestsBeforeStartFail) {
    AlpacaBroker broker(broker_config, connectivity_manager, logging_context);
    EXPECT_THROW(broker.get_cash(), ConnectionError);
    EXPECT_THROW(broker.place_order(make_request(OrderSide::BUY, 1, OrderType::MARKET)), ConnectionError);
}

TEST_F(AlpacaBrokerTest, ReportsAlpacaVocabulary) {
    AlpacaBroker broker(broker_config, connectivity_manager, logging_context);
    EXPECT_EQ(broker.get_status_vocabulary(), BrokerStatusVocabulary::ALPACA);
    EXPECT_EQ(broker.get_broker_name(), "Alpaca");
}

TEST_F(AlpacaBrokerTest, OrderWritesAreSentOnce) {
    broker_config.retry_count = 3;
    AlpacaBroker broker(broker_config, connectivity_manager, logging_context);

    HttpRequest place_request = broker.build_authenticated_request("https://example.test/v2/orders", "POST", "{}");
    HttpRequest cancel_request = broker.build_authenticated_request("https://example.test/v2/orders/o1", "DELETE", "");
    HttpRequest status_request = broker.build_authenticated_request("https://example.test/v2/orders/o1", "GET", "");

    EXPECT_EQ(place_request.retries, 1);
    EXPECT_EQ(place_request.body, "{}");
    EXPECT_EQ(cancel_request.retries, 1);
    EXPECT_EQ(status_request.retries, 3);
    ASSERT_EQ(place_request.headers.size(), 2u);
    EXPECT_EQ(place_request.headers[0].rfind("APCA-API-KEY-ID: ", 0), 0u);
}

TEST(HttpAttemptLimitTest, OnlyReadsAreRepeated) {
    EXPECT_EQ(resolve_attempt_limit("GET", 4), 4);
    EXPECT_EQ(resolve_attempt_limit("GET", 0), 1);
    EXPECT_EQ(resolve_attempt_limit("POST", 4), 1);
    EXPECT_EQ(resolve_attempt_limit("DELETE", 4), 1);
}
