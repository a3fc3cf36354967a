#include "broker_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace IntradayTrader {
namespace Logging {

void BrokerLogs::log_broker_started(LoggingContext& logging_context, const std::string& broker_name, double available_cash) {
    std::ostringstream cash_stream;
    cash_stream << std::fixed << std::setprecision(2) << available_cash;
    LOG_SECTION_HEADER(logging_context, "BROKER SESSION");
    LOG_CONTENT(logging_context, "Broker: " + broker_name);
    LOG_CONTENT(logging_context, "Available cash: " + cash_stream.str());
    LOG_SECTION_FOOTER(logging_context);
}

void BrokerLogs::log_broker_stopped(LoggingContext& logging_context, const std::string& broker_name) {
    log_message(logging_context, broker_name + " session closed");
}

void BrokerLogs::log_paper_fill(LoggingContext& logging_context, const std::string& order_id, const Core::OrderRequest& order_request,
                                double fill_price, double remaining_cash) {
    std::ostringstream fill_stream;
    fill_stream << std::fixed << std::setprecision(4)
                << "Paper fill " << order_id << ": " << Core::to_string(order_request.side) << " "
                << order_request.quantity << " " << order_request.instrument.symbol << " @ " << fill_price
                << std::setprecision(2) << " (cash " << remaining_cash << ")";
    log_message(logging_context, fill_stream.str());
}

void BrokerLogs::log_paper_rejection(LoggingContext& logging_context, const std::string& order_id, const std::string& symbol,
                                     const std::string& rejection_reason) {
    LOG_WARNING(logging_context, "Paper order " + order_id + " for " + symbol + " rejected: " + rejection_reason);
}

void BrokerLogs::log_order_resting(LoggingContext& logging_context, const std::string& order_id, const Core::OrderRequest& order_request) {
    log_message(logging_context, "Order " + order_id + " resting: " + Core::to_string(order_request.order_type) + " " +
                                 Core::to_string(order_request.side) + " " + std::to_string(order_request.quantity) + " " +
                                 order_request.instrument.symbol);
}

void BrokerLogs::log_request_failed(LoggingContext& logging_context, const std::string& broker_name, const std::string& operation_name,
                                    const std::string& error_message) {
    LOG_ERROR(logging_context, broker_name + " " + operation_name + " failed: " + error_message);
}

} // namespace Logging
} // namespace IntradayTrader
