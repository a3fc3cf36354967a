#include "order_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace IntradayTrader {
namespace Logging {

namespace {

std::string format_price(double price_value) {
    std::ostringstream price_stream;
    price_stream << std::fixed << std::setprecision(4) << price_value;
    return price_stream.str();
}

} // anonymous namespace

void OrderLogs::log_order_instruction(LoggingContext& logging_context, const Core::OrderInstruction& order_instruction) {
    std::string instruction_text = "New order instruction: " + order_instruction.instrument +
                                   " qty " + std::to_string(order_instruction.quantity) +
                                   " " + Core::to_string(order_instruction.order_type) +
                                   " " + Core::to_string(order_instruction.time_in_force);
    if (order_instruction.limit_price) {
        instruction_text += " limit " + format_price(*order_instruction.limit_price);
    }
    if (order_instruction.stop_price) {
        instruction_text += " stop " + format_price(*order_instruction.stop_price);
    }
    log_message(logging_context, instruction_text);
}

void OrderLogs::log_order_submitted(LoggingContext& logging_context, const std::string& order_id,
                                    const Core::OrderRequest& order_request, Core::OrderState order_state) {
    LOG_SECTION_HEADER(logging_context, "ORDER SUBMITTED");
    LOG_CONTENT(logging_context, "Order id: " + order_id);
    LOG_CONTENT(logging_context, Core::to_string(order_request.side) + " " + std::to_string(order_request.quantity) + " " +
                                 order_request.instrument.symbol + " (" + Core::to_string(order_request.order_type) + ", " +
                                 Core::to_string(order_request.time_in_force) + ")");
    LOG_CONTENT(logging_context, "State: " + Core::to_string(order_state));
    LOG_SECTION_FOOTER(logging_context);
}

void OrderLogs::log_order_filled(LoggingContext& logging_context, const std::string& order_id, double filled_price) {
    log_message(logging_context, "Order " + order_id + " filled at price " + format_price(filled_price));
}

void OrderLogs::log_broker_error_code(LoggingContext& logging_context, const std::string& order_id,
                                      int error_code, const std::string& error_message) {
    LOG_WARNING(logging_context, "Order " + order_id + " reported error code " + std::to_string(error_code) +
                                 (error_message.empty() ? std::string() : ": " + error_message));
}

void OrderLogs::log_order_not_found(LoggingContext& logging_context, const std::string& order_id, const std::string& operation_name) {
    LOG_ERROR(logging_context, "Order " + order_id + " not found (" + operation_name + ")");
}

void OrderLogs::log_unmapped_status(LoggingContext& logging_context, const std::string& order_id, const std::string& broker_status) {
    LOG_WARNING(logging_context, "Order " + order_id + " has unmapped broker status '" + broker_status + "'");
}

void OrderLogs::log_terminal_state_kept(LoggingContext& logging_context, const std::string& order_id,
                                        Core::OrderState kept_state, const std::string& broker_status) {
    LOG_WARNING(logging_context, "Order " + order_id + " already " + Core::to_string(kept_state) +
                                 ", ignoring broker status '" + broker_status + "'");
}

void OrderLogs::log_no_open_orders(LoggingContext& logging_context) {
    log_message(logging_context, "No matching open orders to cancel");
}

void OrderLogs::log_order_cancelled(LoggingContext& logging_context, const std::string& order_id) {
    log_message(logging_context, "Order " + order_id + " cancelled");
}

void OrderLogs::log_cancel_failed(LoggingContext& logging_context, const std::string& order_id, const std::string& error_message) {
    LOG_ERROR(logging_context, "Cancelling order " + order_id + " failed: " + error_message);
}

void OrderLogs::log_closing_position(LoggingContext& logging_context, const std::string& symbol, int held_quantity) {
    log_message(logging_context, "Closing position " + symbol + " (holding " + std::to_string(held_quantity) + ")");
}

void OrderLogs::log_position_skipped(LoggingContext& logging_context, const std::string& symbol, const std::string& skip_reason) {
    log_message(logging_context, "Skipping position " + symbol + ": " + skip_reason);
}

void OrderLogs::log_positions_unavailable(LoggingContext& logging_context, const std::vector<std::string>& symbols,
                                          const std::string& error_message) {
    std::string symbol_list = symbols.empty() ? std::string("all holdings") : std::string();
    for (const std::string& symbol : symbols) {
        if (!symbol_list.empty()) {
            symbol_list += ", ";
        }
        symbol_list += symbol;
    }
    LOG_ERROR(logging_context, "Cannot read positions for " + symbol_list + ", nothing closed: " + error_message);
}

void OrderLogs::log_close_failed(LoggingContext& logging_context, const std::string& symbol, const std::string& error_message) {
    LOG_ERROR(logging_context, "Closing position " + symbol + " failed: " + error_message);
}

} // namespace Logging
} // namespace IntradayTrader
