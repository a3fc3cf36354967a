#include "data_sync_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace IntradayTrader {
namespace Logging {

namespace {

std::string join_feed_names(const std::vector<std::string>& feed_names) {
    std::string joined_names;
    for (const std::string& feed_name : feed_names) {
        if (!joined_names.empty()) {
            joined_names += ", ";
        }
        joined_names += feed_name;
    }
    return joined_names;
}

} // anonymous namespace

void DataSyncLogs::log_feed_up_to_date(LoggingContext& logging_context, const std::string& feed_name, double age_seconds) {
    std::ostringstream message_stream;
    message_stream << "Feed " << feed_name << " up to date (age " << std::fixed << std::setprecision(1) << age_seconds << "s)";
    log_message(logging_context, message_stream.str());
}

void DataSyncLogs::log_fetching_feed(LoggingContext& logging_context, const std::string& feed_name, const std::string& symbol,
                                     const std::string& interval, const std::string& period) {
    log_message(logging_context, "Getting " + feed_name + " (" + symbol + ") " + interval + " data, period " + period + "...");
}

void DataSyncLogs::log_fetch_empty(LoggingContext& logging_context, const std::string& feed_name) {
    LOG_ERROR(logging_context, "Getting data " + feed_name + " error. No data retrieved.");
}

void DataSyncLogs::log_fetch_failed(LoggingContext& logging_context, const std::string& feed_name, const std::string& error_message) {
    LOG_ERROR(logging_context, "Fetching data " + feed_name + " failed: " + error_message);
}

void DataSyncLogs::log_feed_updated(LoggingContext& logging_context, const std::string& feed_name,
                                    const std::string& latest_time_text, size_t row_count) {
    log_message(logging_context, "Feed " + feed_name + " updated: " + std::to_string(row_count) + " rows, latest " + latest_time_text);
}

void DataSyncLogs::log_feed_late(LoggingContext& logging_context, const std::string& feed_name, const std::string& latest_time_text) {
    LOG_WARNING(logging_context, "Data " + feed_name + " is not updated yet. Latest update time: " + latest_time_text);
}

void DataSyncLogs::log_feed_stale(LoggingContext& logging_context, const std::string& feed_name, const std::string& latest_time_text) {
    LOG_ERROR(logging_context, "Data " + feed_name + " is too old. Latest update time: " + latest_time_text);
}

void DataSyncLogs::log_retry_round(LoggingContext& logging_context, int retry_round, int max_retry_rounds,
                                   const std::vector<std::string>& retry_feed_names) {
    log_message(logging_context, "Sync retry " + std::to_string(retry_round) + "/" + std::to_string(max_retry_rounds) +
                                 " for: " + join_feed_names(retry_feed_names));
}

void DataSyncLogs::log_retry_exhausted(LoggingContext& logging_context, int max_retry_rounds,
                                       const std::vector<std::string>& pending_feed_names) {
    LOG_WARNING(logging_context, "Sync retries exhausted after " + std::to_string(max_retry_rounds) +
                                 " rounds, still waiting on: " + join_feed_names(pending_feed_names));
}

void DataSyncLogs::log_sync_outcome(LoggingContext& logging_context, const Core::SyncOutcome& sync_outcome) {
    LOG_SECTION_HEADER(logging_context, "DATA SYNC - " + Core::to_string(sync_outcome.kind));
    for (const auto& feed_result_entry : sync_outcome.feed_results) {
        LOG_CONTENT(logging_context, feed_result_entry.first + ": " + Core::to_string(feed_result_entry.second));
    }
    if (!sync_outcome.stale_feeds.empty()) {
        LOG_CONTENT(logging_context, "Stale: " + join_feed_names(sync_outcome.stale_feeds));
    }
    LOG_SECTION_FOOTER(logging_context);
}

void DataSyncLogs::log_initial_load(LoggingContext& logging_context, const std::string& feed_name, Core::FreshnessResult freshness_result) {
    log_message(logging_context, "Initial load " + feed_name + ": " + Core::to_string(freshness_result));
}

} // namespace Logging
} // namespace IntradayTrader
