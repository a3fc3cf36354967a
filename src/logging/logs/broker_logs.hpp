#ifndef BROKER_LOGS_HPP
#define BROKER_LOGS_HPP

#include <string>
#include "logging/logger/async_logger.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace IntradayTrader {
namespace Logging {

class BrokerLogs {
public:
    static void log_broker_started(LoggingContext& logging_context, const std::string& broker_name, double available_cash);
    static void log_broker_stopped(LoggingContext& logging_context, const std::string& broker_name);
    static void log_paper_fill(LoggingContext& logging_context, const std::string& order_id, const Core::OrderRequest& order_request,
                               double fill_price, double remaining_cash);
    static void log_paper_rejection(LoggingContext& logging_context, const std::string& order_id, const std::string& symbol,
                                    const std::string& rejection_reason);
    static void log_order_resting(LoggingContext& logging_context, const std::string& order_id, const Core::OrderRequest& order_request);
    static void log_request_failed(LoggingContext& logging_context, const std::string& broker_name, const std::string& operation_name,
                                   const std::string& error_message);
};

} // namespace Logging
} // namespace IntradayTrader

#endif // BROKER_LOGS_HPP
