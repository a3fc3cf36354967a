#include "strategy_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace IntradayTrader {
namespace Logging {

void StrategyLogs::log_insufficient_data(LoggingContext& logging_context, const std::string& feed_name,
                                         size_t available_bars, size_t required_bars) {
    log_message(logging_context, "Strategy waiting for data on " + feed_name + ": have " + std::to_string(available_bars) +
                                 " bars, need " + std::to_string(required_bars));
}

void StrategyLogs::log_indicator_snapshot(LoggingContext& logging_context, double close_price, double momentum_value,
                                          double momentum_average, int crossover_direction, double williams_r_value) {
    std::ostringstream snapshot_stream;
    snapshot_stream << std::fixed << std::setprecision(2)
                    << "Close " << close_price
                    << " | Momentum " << momentum_value
                    << " | Momentum SMA " << momentum_average
                    << " | Cross " << crossover_direction
                    << " | Williams %R " << williams_r_value;
    LOG_SECTION_HEADER(logging_context, "STRATEGY INDICATORS");
    LOG_CONTENT(logging_context, snapshot_stream.str());
    LOG_SECTION_FOOTER(logging_context);
}

void StrategyLogs::log_exit_signal(LoggingContext& logging_context, const std::string& symbol, const std::string& exit_reason,
                                   double close_price, double average_cost) {
    std::ostringstream exit_stream;
    exit_stream << std::fixed << std::setprecision(4)
                << exit_reason << " on " << symbol << " (close " << close_price << ", cost " << average_cost << ")";
    log_message(logging_context, exit_stream.str());
}

void StrategyLogs::log_entry_signal(LoggingContext& logging_context, const std::string& symbol, int order_quantity,
                                    const std::string& entry_reason) {
    log_message(logging_context, entry_reason + ": " + symbol + " qty " + std::to_string(order_quantity));
}

} // namespace Logging
} // namespace IntradayTrader
