#include <gtest/gtest.h>
#include "trader/errors/trading_errors.hpp"
#include "trader/strategy_analysis/momentum_williams_strategy.hpp"
#include "mocks/mock_broker.hpp"

using namespace IntradayTrader::Core;
using IntradayTrader::Logging::LoggingContext;
using IntradayTrader::Tests::MockBroker;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

BarTable bars_from_closes(const std::vector<double>& closes) {
    BarTable bars;
    for (double close_price : closes) {
        Bar bar;
        bar.open_price = close_price;
        bar.high_price = close_price;
        bar.low_price = close_price;
        bar.close_price = close_price;
        bars.push_back(bar);
    }
    return bars;
}

Position holding(const std::string& symbol, int quantity, double average_cost) {
    Position position;
    position.symbol = symbol;
    position.currency = "USD";
    position.quantity = quantity;
    position.average_cost = average_cost;
    return position;
}

// Momentum dips then turns up on the last bar, closing at the bottom of its range
const std::vector<double> UP_CROSS_CLOSES = {100.0, 100.0, 90.0, 80.0, 79.0};
// Momentum peaks then turns down on the last bar, closing at the top of its range
const std::vector<double> DOWN_CROSS_CLOSES = {100.0, 100.0, 105.0, 116.0, 117.0};

} // anonymous namespace

class MomentumWilliamsStrategyTest : public ::testing::Test {
protected:
    MomentumWilliamsStrategyTest() {
        strategy_config.quote_feed_name = "soxl";
        strategy_config.quote_instrument = "SOXL-USD-SPOT";
        strategy_config.momentum_period = 1;
        strategy_config.momentum_ma_period = 2;
        strategy_config.williams_period = 3;
        strategy_config.williams_upper = -40.0;
        strategy_config.williams_lower = -60.0;
        strategy_config.stop_loss = 0.1;
        strategy_config.take_profit = 0.3;
        strategy_config.cash_utilization = 0.95;
        ON_CALL(broker, get_cash()).WillByDefault(Return(10000.0));
        ON_CALL(broker, get_positions(_)).WillByDefault(Return(PositionMap{}));
    }

    void enable_hedge() {
        strategy_config.hedge_feed_name = "soxs";
        strategy_config.hedge_instrument = "SOXS-USD-SPOT";
    }

    NiceMock<MockBroker> broker;
    StrategyConfig strategy_config;
    LoggingContext logging_context;
};

TEST_F(MomentumWilliamsStrategyTest, ReportsName) {
    MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context);
    EXPECT_EQ(strategy.get_strategy_name(), "MomentumWilliamsR");
}

TEST_F(MomentumWilliamsStrategyTest, MalformedInstrumentFailsConstruction) {
    strategy_config.quote_instrument = "SOXL";
    EXPECT_THROW({ MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context); }, InvalidInstrumentFormat);
}

TEST_F(MomentumWilliamsStrategyTest, InsufficientBarsProduceNothing) {
    EXPECT_CALL(broker, get_positions(_)).Times(0);
    MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context);

    FeedDataMap feed_data;
    feed_data["soxl"] = bars_from_closes({100.0, 101.0});
    EXPECT_TRUE(strategy.decide(feed_data).empty());
    EXPECT_TRUE(strategy.decide(FeedDataMap{}).empty());
}

TEST_F(MomentumWilliamsStrategyTest, UpCrossBuysWithCashSizing) {
    MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context);

    FeedDataMap feed_data;
    feed_data["soxl"] = bars_from_closes(UP_CROSS_CLOSES);
    std::vector<OrderInstruction> order_instructions = strategy.decide(feed_data);

    ASSERT_EQ(order_instructions.size(), 1u);
    EXPECT_EQ(order_instructions[0].instrument, "SOXL-USD-SPOT");
    EXPECT_EQ(order_instructions[0].quantity, 120);
    EXPECT_EQ(order_instructions[0].order_type, OrderType::MARKET);
    EXPECT_EQ(order_instructions[0].time_in_force, TimeInForce::DAY);
}

TEST_F(MomentumWilliamsStrategyTest, DownCrossSellsShortInSingleMode) {
    MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context);

    FeedDataMap feed_data;
    feed_data["soxl"] = bars_from_closes(DOWN_CROSS_CLOSES);
    std::vector<OrderInstruction> order_instructions = strategy.decide(feed_data);

    ASSERT_EQ(order_instructions.size(), 1u);
    EXPECT_EQ(order_instructions[0].quantity, -81);
}

TEST_F(MomentumWilliamsStrategyTest, StopLossClosesLongPosition) {
    PositionMap positions;
    positions["SOXL"] = holding("SOXL", 10, 100.0);
    ON_CALL(broker, get_positions(_)).WillByDefault(Return(positions));
    MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context);

    FeedDataMap feed_data;
    feed_data["soxl"] = bars_from_closes({80.0, 80.0, 80.0, 80.0, 80.0});
    std::vector<OrderInstruction> order_instructions = strategy.decide(feed_data);

    ASSERT_EQ(order_instructions.size(), 1u);
    EXPECT_EQ(order_instructions[0].quantity, -10);
}

TEST_F(MomentumWilliamsStrategyTest, NoSignalHoldsPosition) {
    PositionMap positions;
    positions["SOXL"] = holding("SOXL", 10, 100.0);
    ON_CALL(broker, get_positions(_)).WillByDefault(Return(positions));
    MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context);

    FeedDataMap feed_data;
    feed_data["soxl"] = bars_from_closes({100.0, 100.0, 100.0, 100.0, 100.0});
    EXPECT_TRUE(strategy.decide(feed_data).empty());
}

TEST_F(MomentumWilliamsStrategyTest, PairModeUpCrossBuysQuote) {
    enable_hedge();
    MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context);

    FeedDataMap feed_data;
    feed_data["soxl"] = bars_from_closes(UP_CROSS_CLOSES);
    feed_data["soxs"] = bars_from_closes({20.0});
    std::vector<OrderInstruction> order_instructions = strategy.decide(feed_data);

    ASSERT_EQ(order_instructions.size(), 1u);
    EXPECT_EQ(order_instructions[0].instrument, "SOXL-USD-SPOT");
    EXPECT_EQ(order_instructions[0].quantity, 120);
}

TEST_F(MomentumWilliamsStrategyTest, PairModeDownCrossRotatesIntoHedge) {
    enable_hedge();
    PositionMap positions;
    positions["SOXL"] = holding("SOXL", 50, 117.0);
    ON_CALL(broker, get_positions(_)).WillByDefault(Return(positions));
    MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context);

    FeedDataMap feed_data;
    feed_data["soxl"] = bars_from_closes(DOWN_CROSS_CLOSES);
    feed_data["soxs"] = bars_from_closes({20.0});
    std::vector<OrderInstruction> order_instructions = strategy.decide(feed_data);

    ASSERT_EQ(order_instructions.size(), 2u);
    EXPECT_EQ(order_instructions[0].instrument, "SOXL-USD-SPOT");
    EXPECT_EQ(order_instructions[0].quantity, -50);
    EXPECT_EQ(order_instructions[1].instrument, "SOXS-USD-SPOT");
    EXPECT_EQ(order_instructions[1].quantity, 475);
}

TEST_F(MomentumWilliamsStrategyTest, PairModeStopLossRotatesWithCappedCash) {
    enable_hedge();
    ON_CALL(broker, get_cash()).WillByDefault(Return(1000.0));
    PositionMap positions;
    positions["SOXL"] = holding("SOXL", 10, 100.0);
    ON_CALL(broker, get_positions(_)).WillByDefault(Return(positions));
    MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context);

    FeedDataMap feed_data;
    feed_data["soxl"] = bars_from_closes({80.0, 80.0, 80.0, 80.0, 80.0});
    feed_data["soxs"] = bars_from_closes({20.0});
    std::vector<OrderInstruction> order_instructions = strategy.decide(feed_data);

    ASSERT_EQ(order_instructions.size(), 2u);
    EXPECT_EQ(order_instructions[0].quantity, -10);
    EXPECT_EQ(order_instructions[1].instrument, "SOXS-USD-SPOT");
    EXPECT_EQ(order_instructions[1].quantity, 47);
}

TEST_F(MomentumWilliamsStrategyTest, PairModeTakeProfitOnlyExits) {
    enable_hedge();
    PositionMap positions;
    positions["SOXS"] = holding("SOXS", 30, 10.0);
    ON_CALL(broker, get_positions(_)).WillByDefault(Return(positions));
    MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context);

    FeedDataMap feed_data;
    feed_data["soxl"] = bars_from_closes({100.0, 100.0, 100.0, 100.0, 100.0});
    feed_data["soxs"] = bars_from_closes({14.0});
    std::vector<OrderInstruction> order_instructions = strategy.decide(feed_data);

    ASSERT_EQ(order_instructions.size(), 1u);
    EXPECT_EQ(order_instructions[0].instrument, "SOXS-USD-SPOT");
    EXPECT_EQ(order_instructions[0].quantity, -30);
}

TEST_F(MomentumWilliamsStrategyTest, PairModeWithoutHedgeDataWaits) {
    enable_hedge();
    MomentumWilliamsStrategy strategy(broker, strategy_config, logging_context);

    FeedDataMap feed_data;
    feed_data["soxl"] = bars_from_closes(UP_CROSS_CLOSES);
    EXPECT_TRUE(strategy.decide(feed_data).empty());
}
