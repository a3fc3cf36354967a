#ifndef ORDER_LOGS_HPP
#define ORDER_LOGS_HPP

#include <string>
#include <vector>
#include "logging/logger/async_logger.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace IntradayTrader {
namespace Logging {

/**
 * Logging for order submission, status queries, cancellation and position closure.
 */
class OrderLogs {
public:
    // Submission
    static void log_order_instruction(LoggingContext& logging_context, const Core::OrderInstruction& order_instruction);
    static void log_order_submitted(LoggingContext& logging_context, const std::string& order_id,
                                    const Core::OrderRequest& order_request, Core::OrderState order_state);
    static void log_order_filled(LoggingContext& logging_context, const std::string& order_id, double filled_price);
    static void log_broker_error_code(LoggingContext& logging_context, const std::string& order_id,
                                      int error_code, const std::string& error_message);

    // Status queries
    static void log_order_not_found(LoggingContext& logging_context, const std::string& order_id, const std::string& operation_name);
    static void log_unmapped_status(LoggingContext& logging_context, const std::string& order_id, const std::string& broker_status);
    static void log_terminal_state_kept(LoggingContext& logging_context, const std::string& order_id,
                                        Core::OrderState kept_state, const std::string& broker_status);

    // Cancellation
    static void log_no_open_orders(LoggingContext& logging_context);
    static void log_order_cancelled(LoggingContext& logging_context, const std::string& order_id);
    static void log_cancel_failed(LoggingContext& logging_context, const std::string& order_id, const std::string& error_message);

    // Position closure
    static void log_closing_position(LoggingContext& logging_context, const std::string& symbol, int held_quantity);
    static void log_position_skipped(LoggingContext& logging_context, const std::string& symbol, const std::string& skip_reason);
    static void log_positions_unavailable(LoggingContext& logging_context, const std::vector<std::string>& symbols,
                                          const std::string& error_message);
    static void log_close_failed(LoggingContext& logging_context, const std::string& symbol, const std::string& error_message);
};

} // namespace Logging
} // namespace IntradayTrader

#endif // ORDER_LOGS_HPP
