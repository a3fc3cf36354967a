#ifndef STRATEGY_LOGS_HPP
#define STRATEGY_LOGS_HPP

#include <string>
#include "logging/logger/async_logger.hpp"

namespace IntradayTrader {
namespace Logging {

class StrategyLogs {
public:
    static void log_insufficient_data(LoggingContext& logging_context, const std::string& feed_name,
                                      size_t available_bars, size_t required_bars);
    static void log_indicator_snapshot(LoggingContext& logging_context, double close_price, double momentum_value,
                                       double momentum_average, int crossover_direction, double williams_r_value);
    static void log_exit_signal(LoggingContext& logging_context, const std::string& symbol, const std::string& exit_reason,
                                double close_price, double average_cost);
    static void log_entry_signal(LoggingContext& logging_context, const std::string& symbol, int order_quantity,
                                 const std::string& entry_reason);
};

} // namespace Logging
} // namespace IntradayTrader

#endif // STRATEGY_LOGS_HPP
