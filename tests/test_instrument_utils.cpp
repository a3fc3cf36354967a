#include <gtest/gtest.h>
#include "trader/errors/trading_errors.hpp"
#include "utils/instrument_utils.hpp"

using namespace IntradayTrader::Core;

TEST(InstrumentUtilsTest, ParsesSpotInstrument) {
    Instrument instrument = parse_instrument("SOXL-USD-SPOT");
    EXPECT_EQ(instrument.symbol, "SOXL");
    EXPECT_EQ(instrument.currency, "USD");
    EXPECT_EQ(instrument.trade_type, TradeType::SPOT);
}

TEST(InstrumentUtilsTest, ParsesPerpInstrument) {
    EXPECT_EQ(parse_instrument("BTC-USDT-PERP").trade_type, TradeType::PERP);
}

TEST(InstrumentUtilsTest, AcceptsAnyLetterCase) {
    Instrument instrument = parse_instrument("soxl-usd-spot");
    EXPECT_EQ(instrument.symbol, "SOXL");
    EXPECT_EQ(instrument.currency, "USD");
    EXPECT_EQ(instrument.trade_type, TradeType::SPOT);
    EXPECT_EQ(parse_instrument("Btc-Usdt-Perp").trade_type, TradeType::PERP);
}

TEST(InstrumentUtilsTest, RejectsWrongPartCount) {
    EXPECT_THROW(parse_instrument("SOXL-USD"), InvalidInstrumentFormat);
    EXPECT_THROW(parse_instrument("SOXL-USD-SPOT-X"), InvalidInstrumentFormat);
    EXPECT_THROW(parse_instrument(""), InvalidInstrumentFormat);
}

TEST(InstrumentUtilsTest, RejectsEmptyParts) {
    EXPECT_THROW(parse_instrument("-USD-SPOT"), InvalidInstrumentFormat);
    EXPECT_THROW(parse_instrument("SOXL--SPOT"), InvalidInstrumentFormat);
    EXPECT_THROW(parse_instrument("SOXL-USD-"), InvalidInstrumentFormat);
}

TEST(InstrumentUtilsTest, RejectsUnknownTradeType) {
    EXPECT_THROW(parse_instrument("SOXL-USD-FUTURE"), InvalidInstrumentFormat);
}

TEST(InstrumentUtilsTest, FormatsBackToText) {
    EXPECT_EQ(format_instrument(Instrument("AAPL", "USD", TradeType::SPOT)), "AAPL-USD-SPOT");
}

TEST(OrderVocabularyTest, OrderTypeCodes) {
    EXPECT_EQ(to_string(OrderType::STOP_LIMIT), "STP LMT");
    EXPECT_EQ(parse_order_type("TRAIL LIMIT"), OrderType::TRAILING_LIMIT);
    EXPECT_EQ(parse_order_type("MOC"), OrderType::MARKET_ON_CLOSE);
    EXPECT_THROW(parse_order_type("ICEBERG"), InvalidOrder);
}

TEST(OrderVocabularyTest, TimeInForceCodes) {
    EXPECT_EQ(to_string(TimeInForce::GTC_EXTENDED), "GTC_EXT");
    EXPECT_EQ(parse_time_in_force("FILL_OR_KILL"), TimeInForce::FILL_OR_KILL);
    EXPECT_THROW(parse_time_in_force("IOC"), InvalidOrder);
}

TEST(OrderVocabularyTest, TradeTypeParsing) {
    EXPECT_EQ(parse_trade_type("SPOT"), TradeType::SPOT);
    EXPECT_THROW(parse_trade_type("OPTION"), UnknownTradeType);
}

TEST(OrderVocabularyTest, TerminalStates) {
    EXPECT_TRUE(is_terminal_state(OrderState::FILLED));
    EXPECT_TRUE(is_terminal_state(OrderState::CANCELLED));
    EXPECT_TRUE(is_terminal_state(OrderState::REJECTED));
    EXPECT_FALSE(is_terminal_state(OrderState::PARTIALLY_FILLED));
    EXPECT_FALSE(is_terminal_state(OrderState::UNKNOWN));
}
