#include "data_structures.hpp"
#include "trader/errors/trading_errors.hpp"

namespace IntradayTrader {
namespace Core {

std::string to_string(FreshnessResult freshness_result) {
    switch (freshness_result) {
        case FreshnessResult::UP_TO_DATE:
            return "UP_TO_DATE";
        case FreshnessResult::UPDATED:
            return "UPDATED";
        case FreshnessResult::UPDATED_BUT_LATE:
            return "UPDATED_BUT_LATE";
        case FreshnessResult::STALE:
            return "STALE";
        case FreshnessResult::FETCH_ERROR:
            return "FETCH_ERROR";
    }
    return "UNKNOWN";
}

std::string to_string(SyncOutcomeKind outcome_kind) {
    switch (outcome_kind) {
        case SyncOutcomeKind::ALL_FRESH:
            return "ALL_FRESH";
        case SyncOutcomeKind::ALL_UP_TO_DATE:
            return "ALL_UP_TO_DATE";
        case SyncOutcomeKind::NEEDS_RETRY:
            return "NEEDS_RETRY";
        case SyncOutcomeKind::ABORT:
            return "ABORT";
    }
    return "UNKNOWN";
}

std::string to_string(TradeType trade_type) {
    switch (trade_type) {
        case TradeType::SPOT:
            return "SPOT";
        case TradeType::PERP:
            return "PERP";
    }
    return "UNKNOWN";
}

std::string to_string(OrderSide order_side) {
    return order_side == OrderSide::BUY ? "BUY" : "SELL";
}

// Broker wire codes
std::string to_string(OrderType order_type) {
    switch (order_type) {
        case OrderType::MARKET:
            return "MKT";
        case OrderType::LIMIT:
            return "LMT";
        case OrderType::STOP:
            return "STP";
        case OrderType::STOP_LIMIT:
            return "STP LMT";
        case OrderType::TRAILING:
            return "TRAIL";
        case OrderType::TRAILING_LIMIT:
            return "TRAIL LIMIT";
        case OrderType::MARKET_ON_CLOSE:
            return "MOC";
        case OrderType::LIMIT_ON_CLOSE:
            return "LOC";
    }
    return "UNKNOWN";
}

std::string to_string(TimeInForce time_in_force) {
    switch (time_in_force) {
        case TimeInForce::DAY:
            return "DAY";
        case TimeInForce::AM:
            return "AM";
        case TimeInForce::PM:
            return "PM";
        case TimeInForce::EXTENDED:
            return "EXTENDED";
        case TimeInForce::GOOD_TILL_CANCEL:
            return "GOOD_TILL_CANCEL";
        case TimeInForce::GTC_EXTENDED:
            return "GTC_EXT";
        case TimeInForce::FILL_OR_KILL:
            return "FILL_OR_KILL";
    }
    return "UNKNOWN";
}

std::string to_string(OrderState order_state) {
    switch (order_state) {
        case OrderState::PENDING:
            return "PENDING";
        case OrderState::SUBMITTED:
            return "SUBMITTED";
        case OrderState::PARTIALLY_FILLED:
            return "PARTIALLY_FILLED";
        case OrderState::FILLED:
            return "FILLED";
        case OrderState::CANCELLED:
            return "CANCELLED";
        case OrderState::REJECTED:
            return "REJECTED";
        case OrderState::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

TradeType parse_trade_type(const std::string& trade_type_text) {
    if (trade_type_text == "SPOT") {
        return TradeType::SPOT;
    }
    if (trade_type_text == "PERP") {
        return TradeType::PERP;
    }
    throw UnknownTradeType(trade_type_text);
}

OrderType parse_order_type(const std::string& order_type_text) {
    if (order_type_text == "MKT") return OrderType::MARKET;
    if (order_type_text == "LMT") return OrderType::LIMIT;
    if (order_type_text == "STP") return OrderType::STOP;
    if (order_type_text == "STP LMT") return OrderType::STOP_LIMIT;
    if (order_type_text == "TRAIL") return OrderType::TRAILING;
    if (order_type_text == "TRAIL LIMIT") return OrderType::TRAILING_LIMIT;
    if (order_type_text == "MOC") return OrderType::MARKET_ON_CLOSE;
    if (order_type_text == "LOC") return OrderType::LIMIT_ON_CLOSE;
    throw InvalidOrder("unsupported order type '" + order_type_text + "'");
}

TimeInForce parse_time_in_force(const std::string& time_in_force_text) {
    if (time_in_force_text == "DAY") return TimeInForce::DAY;
    if (time_in_force_text == "AM") return TimeInForce::AM;
    if (time_in_force_text == "PM") return TimeInForce::PM;
    if (time_in_force_text == "EXTENDED") return TimeInForce::EXTENDED;
    if (time_in_force_text == "GOOD_TILL_CANCEL") return TimeInForce::GOOD_TILL_CANCEL;
    if (time_in_force_text == "GTC_EXT") return TimeInForce::GTC_EXTENDED;
    if (time_in_force_text == "FILL_OR_KILL") return TimeInForce::FILL_OR_KILL;
    throw InvalidOrder("unsupported time in force '" + time_in_force_text + "'");
}

bool is_terminal_state(OrderState order_state) {
    return order_state == OrderState::FILLED || order_state == OrderState::CANCELLED ||
           order_state == OrderState::REJECTED;
}

} // namespace Core
} // namespace IntradayTrader
