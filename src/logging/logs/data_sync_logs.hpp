#ifndef DATA_SYNC_LOGS_HPP
#define DATA_SYNC_LOGS_HPP

#include <string>
#include <vector>
#include "logging/logger/async_logger.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace IntradayTrader {
namespace Logging {

/**
 * Logging for feed freshness classification and per-tick data synchronization.
 */
class DataSyncLogs {
public:
    // Freshness classification
    static void log_feed_up_to_date(LoggingContext& logging_context, const std::string& feed_name, double age_seconds);
    static void log_fetching_feed(LoggingContext& logging_context, const std::string& feed_name, const std::string& symbol,
                                  const std::string& interval, const std::string& period);
    static void log_fetch_empty(LoggingContext& logging_context, const std::string& feed_name);
    static void log_fetch_failed(LoggingContext& logging_context, const std::string& feed_name, const std::string& error_message);
    static void log_feed_updated(LoggingContext& logging_context, const std::string& feed_name,
                                 const std::string& latest_time_text, size_t row_count);
    static void log_feed_late(LoggingContext& logging_context, const std::string& feed_name, const std::string& latest_time_text);
    static void log_feed_stale(LoggingContext& logging_context, const std::string& feed_name, const std::string& latest_time_text);

    // Synchronization
    static void log_retry_round(LoggingContext& logging_context, int retry_round, int max_retry_rounds,
                                const std::vector<std::string>& retry_feed_names);
    static void log_retry_exhausted(LoggingContext& logging_context, int max_retry_rounds,
                                    const std::vector<std::string>& pending_feed_names);
    static void log_sync_outcome(LoggingContext& logging_context, const Core::SyncOutcome& sync_outcome);
    static void log_initial_load(LoggingContext& logging_context, const std::string& feed_name, Core::FreshnessResult freshness_result);
};

} // namespace Logging
} // namespace IntradayTrader

#endif // DATA_SYNC_LOGS_HPP
