#ifndef TRADING_LOOP_LOGS_HPP
#define TRADING_LOOP_LOGS_HPP

#include <string>
#include <vector>
#include "logging/logger/async_logger.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace IntradayTrader {
namespace Logging {

/**
 * Logging for the trading loop: start-up, per-tick decisions and end-of-day liquidation.
 */
class TradingLoopLogs {
public:
    // Start-up
    static void log_loop_starting(LoggingContext& logging_context, const std::string& broker_name,
                                  const std::string& strategy_name, size_t feed_count);
    static void log_broker_connect_attempt(LoggingContext& logging_context, int attempt_number, int max_attempts);
    static void log_broker_connect_failed(LoggingContext& logging_context, int attempt_number, const std::string& error_message);
    static void log_broker_connected(LoggingContext& logging_context, const std::string& broker_name);

    // Per tick
    static void log_tick_header(LoggingContext& logging_context, unsigned long tick_number, const std::string& time_text);
    static void log_state_change(LoggingContext& logging_context, const std::string& previous_state, const std::string& next_state);
    static void log_strategy_decision(LoggingContext& logging_context, const std::string& strategy_name,
                                      const std::vector<Core::OrderInstruction>& order_instructions);
    static void log_strategy_failed(LoggingContext& logging_context, const std::string& strategy_name, const std::string& error_message);
    static void log_instruction_submitted(LoggingContext& logging_context, const std::string& instrument, const std::string& order_id);
    static void log_submission_failed(LoggingContext& logging_context, const std::string& instrument, const std::string& error_message);
    static void log_stale_abort(LoggingContext& logging_context, const std::vector<std::string>& stale_feeds, long long backoff_milliseconds);
    static void log_sync_incomplete(LoggingContext& logging_context);

    // Shutdown
    static void log_end_of_day(LoggingContext& logging_context, const std::string& time_text, size_t tracked_symbol_count);
    static void log_liquidation_orders(LoggingContext& logging_context, const std::vector<std::string>& order_ids);
    static void log_liquidation_failed(LoggingContext& logging_context, const std::string& error_message);
    static void log_broker_stop_failed(LoggingContext& logging_context, const std::string& error_message);
    static void log_external_stop(LoggingContext& logging_context);
    static void log_loop_stopped(LoggingContext& logging_context, unsigned long tick_count);
};

} // namespace Logging
} // namespace IntradayTrader

#endif // TRADING_LOOP_LOGS_HPP
