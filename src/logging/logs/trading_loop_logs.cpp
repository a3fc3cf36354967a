#include "trading_loop_logs.hpp"
#include "logging/logger/logging_macros.hpp"

namespace IntradayTrader {
namespace Logging {

void TradingLoopLogs::log_loop_starting(LoggingContext& logging_context, const std::string& broker_name,
                                        const std::string& strategy_name, size_t feed_count) {
    LOG_SECTION_HEADER(logging_context, "TRADING LOOP STARTING");
    LOG_CONTENT(logging_context, "Broker: " + broker_name);
    LOG_CONTENT(logging_context, "Strategy: " + strategy_name);
    LOG_CONTENT(logging_context, "Feeds: " + std::to_string(feed_count));
    LOG_SECTION_FOOTER(logging_context);
}

void TradingLoopLogs::log_broker_connect_attempt(LoggingContext& logging_context, int attempt_number, int max_attempts) {
    log_message(logging_context, "Connecting to broker (attempt " + std::to_string(attempt_number) + "/" + std::to_string(max_attempts) + ")");
}

void TradingLoopLogs::log_broker_connect_failed(LoggingContext& logging_context, int attempt_number, const std::string& error_message) {
    LOG_WARNING(logging_context, "Broker connection attempt " + std::to_string(attempt_number) + " failed: " + error_message);
}

void TradingLoopLogs::log_broker_connected(LoggingContext& logging_context, const std::string& broker_name) {
    log_message(logging_context, "Connected to " + broker_name);
}

void TradingLoopLogs::log_tick_header(LoggingContext& logging_context, unsigned long tick_number, const std::string& time_text) {
    LOG_TRADING_TICK_HEADER(logging_context, tick_number, time_text);
}

void TradingLoopLogs::log_state_change(LoggingContext& logging_context, const std::string& previous_state, const std::string& next_state) {
    log_message(logging_context, "Loop state " + previous_state + " -> " + next_state);
}

void TradingLoopLogs::log_strategy_decision(LoggingContext& logging_context, const std::string& strategy_name,
                                            const std::vector<Core::OrderInstruction>& order_instructions) {
    if (order_instructions.empty()) {
        log_message(logging_context, strategy_name + ": no action");
        return;
    }
    LOG_SECTION_HEADER(logging_context, strategy_name + " DECISION");
    for (const Core::OrderInstruction& order_instruction : order_instructions) {
        LOG_CONTENT(logging_context, order_instruction.instrument + " qty " + std::to_string(order_instruction.quantity) +
                                     " " + Core::to_string(order_instruction.order_type));
    }
    LOG_SECTION_FOOTER(logging_context);
}

void TradingLoopLogs::log_strategy_failed(LoggingContext& logging_context, const std::string& strategy_name, const std::string& error_message) {
    LOG_ERROR(logging_context, strategy_name + " failed to decide, no orders this tick: " + error_message);
}

void TradingLoopLogs::log_instruction_submitted(LoggingContext& logging_context, const std::string& instrument, const std::string& order_id) {
    log_message(logging_context, "Submitted " + instrument + " as order " + order_id);
}

void TradingLoopLogs::log_submission_failed(LoggingContext& logging_context, const std::string& instrument, const std::string& error_message) {
    LOG_ERROR(logging_context, "Submitting " + instrument + " failed: " + error_message);
}

void TradingLoopLogs::log_stale_abort(LoggingContext& logging_context, const std::vector<std::string>& stale_feeds, long long backoff_milliseconds) {
    std::string stale_feed_list;
    for (const std::string& feed_name : stale_feeds) {
        if (!stale_feed_list.empty()) {
            stale_feed_list += ", ";
        }
        stale_feed_list += feed_name;
    }
    LOG_WARNING(logging_context, "Stale data on [" + stale_feed_list + "], skipping tick and backing off " +
                                 std::to_string(backoff_milliseconds) + " ms");
}

void TradingLoopLogs::log_sync_incomplete(LoggingContext& logging_context) {
    LOG_WARNING(logging_context, "Feeds did not converge this tick, strategy skipped");
}

void TradingLoopLogs::log_end_of_day(LoggingContext& logging_context, const std::string& time_text, size_t tracked_symbol_count) {
    LOG_SECTION_HEADER(logging_context, "END OF DAY LIQUIDATION");
    LOG_CONTENT(logging_context, "Time: " + time_text);
    LOG_CONTENT(logging_context, "Closing " + std::to_string(tracked_symbol_count) + " tracked symbols");
    LOG_SECTION_FOOTER(logging_context);
}

void TradingLoopLogs::log_liquidation_orders(LoggingContext& logging_context, const std::vector<std::string>& order_ids) {
    log_message(logging_context, "Liquidation submitted " + std::to_string(order_ids.size()) + " orders");
}

void TradingLoopLogs::log_external_stop(LoggingContext& logging_context) {
    log_message(logging_context, "Stop requested, leaving trading loop");
}

void TradingLoopLogs::log_loop_stopped(LoggingContext& logging_context, unsigned long tick_count) {
    log_message(logging_context, "Trading loop stopped after " + std::to_string(tick_count) + " ticks");
}

void TradingLoopLogs::log_liquidation_failed(LoggingContext& logging_context, const std::string& error_message) {
    LOG_ERROR(logging_context, "End of day liquidation incomplete, positions may remain open: " + error_message);
}

void TradingLoopLogs::log_broker_stop_failed(LoggingContext& logging_context, const std::string& error_message) {
    LOG_ERROR(logging_context, "Broker stop failed: " + error_message);
}

} // namespace Logging
} // namespace IntradayTrader
