#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace IntradayTrader {
namespace Core {

using TimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// MARKET DATA
// ============================================================================

struct Bar {
    TimePoint timestamp;
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double volume;

    Bar() : timestamp(), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), volume(0.0) {}
};

using BarTable = std::vector<Bar>;
using FeedDataMap = std::map<std::string, BarTable>;

struct HistoricalDataRequest {
    std::string symbol;
    std::string interval;
    std::string period;
    std::optional<TimePoint> start_time;
    std::optional<TimePoint> end_time;
};

enum class FreshnessResult {
    UP_TO_DATE,         // Interval has not elapsed, nothing fetched
    UPDATED,            // Fetched and newest bar is within one interval
    UPDATED_BUT_LATE,   // Fetched but provider is lagging by up to one interval
    STALE,              // Fetched data is two or more intervals old
    FETCH_ERROR         // Fetch returned no rows
};

enum class SyncOutcomeKind {
    ALL_FRESH,
    ALL_UP_TO_DATE,
    NEEDS_RETRY,
    ABORT
};

struct SyncOutcome {
    SyncOutcomeKind kind;
    std::chrono::milliseconds recommended_delay;        // Wait before the next tick (retry or abort only)
    std::vector<std::string> stale_feeds;
    std::map<std::string, FreshnessResult> feed_results;

    SyncOutcome() : kind(SyncOutcomeKind::ALL_UP_TO_DATE), recommended_delay(0) {}
};

// ============================================================================
// INSTRUMENTS AND ORDERS
// ============================================================================

enum class TradeType {
    SPOT,
    PERP
};

enum class OrderSide {
    BUY,
    SELL
};

enum class OrderType {
    MARKET,
    LIMIT,
    STOP,
    STOP_LIMIT,
    TRAILING,
    TRAILING_LIMIT,
    MARKET_ON_CLOSE,
    LIMIT_ON_CLOSE
};

enum class TimeInForce {
    DAY,
    AM,
    PM,
    EXTENDED,
    GOOD_TILL_CANCEL,
    GTC_EXTENDED,
    FILL_OR_KILL
};

enum class OrderState {
    PENDING,
    SUBMITTED,
    PARTIALLY_FILLED,
    FILLED,
    CANCELLED,
    REJECTED,
    UNKNOWN
};

struct Instrument {
    std::string symbol;
    std::string currency;
    TradeType trade_type;

    Instrument() : trade_type(TradeType::SPOT) {}
    Instrument(const std::string& symbol_value, const std::string& currency_value, TradeType trade_type_value)
        : symbol(symbol_value), currency(currency_value), trade_type(trade_type_value) {}
};

// What a strategy asks for; quantity is signed (positive buys, negative sells)
struct OrderInstruction {
    std::string instrument;
    int quantity;
    OrderType order_type;
    TimeInForce time_in_force;
    std::optional<double> limit_price;
    std::optional<double> stop_price;

    OrderInstruction() : quantity(0), order_type(OrderType::MARKET), time_in_force(TimeInForce::DAY) {}
    OrderInstruction(const std::string& instrument_value, int quantity_value, OrderType order_type_value = OrderType::MARKET)
        : instrument(instrument_value), quantity(quantity_value), order_type(order_type_value), time_in_force(TimeInForce::DAY) {}
};

// What the broker receives; quantity is always positive
struct OrderRequest {
    Instrument instrument;
    OrderSide side;
    int quantity;
    OrderType order_type;
    TimeInForce time_in_force;
    std::optional<double> limit_price;
    std::optional<double> stop_price;

    OrderRequest() : side(OrderSide::BUY), quantity(0), order_type(OrderType::MARKET), time_in_force(TimeInForce::DAY) {}

    int signed_quantity() const { return side == OrderSide::BUY ? quantity : -quantity; }
};

struct OrderPlacementResult {
    std::string order_id;
    std::string status;              // Broker-native status string at acceptance
    double filled_price;             // Average fill price, 0 when not filled
    int error_code;                  // Broker-reported error, 0 when none
    std::string error_message;

    OrderPlacementResult() : filled_price(0.0), error_code(0) {}
};

struct OpenOrder {
    std::string order_id;
    std::string symbol;
    OrderSide side;
    int quantity;
    std::string status;

    OpenOrder() : side(OrderSide::BUY), quantity(0) {}
};

// Journal entry kept by the order manager for logging and debugging
struct OrderRecord {
    std::string order_id;
    OrderInstruction instruction;
    Instrument instrument;
    OrderState last_known_state;
    std::string last_broker_status;     // Native string behind last_known_state
    double filled_price;
    TimePoint submitted_at;

    OrderRecord() : last_known_state(OrderState::PENDING), filled_price(0.0) {}
};

// ============================================================================
// ACCOUNT
// ============================================================================

struct Position {
    std::string symbol;
    std::string currency;
    TradeType trade_type;
    int quantity;
    double average_cost;
    double unrealized_pnl;

    Position() : trade_type(TradeType::SPOT), quantity(0), average_cost(0.0), unrealized_pnl(0.0) {}
};

using PositionMap = std::map<std::string, Position>;

// ============================================================================
// STRING CONVERSIONS
// ============================================================================

std::string to_string(FreshnessResult freshness_result);
std::string to_string(SyncOutcomeKind outcome_kind);
std::string to_string(TradeType trade_type);
std::string to_string(OrderSide order_side);
std::string to_string(OrderType order_type);
std::string to_string(TimeInForce time_in_force);
std::string to_string(OrderState order_state);

TradeType parse_trade_type(const std::string& trade_type_text);
OrderType parse_order_type(const std::string& order_type_text);
TimeInForce parse_time_in_force(const std::string& time_in_force_text);

bool is_terminal_state(OrderState order_state);

} // namespace Core
} // namespace IntradayTrader

#endif // DATA_STRUCTURES_HPP
