#include "data_freshness_tracker.hpp"
#include "logging/logs/data_sync_logs.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>

namespace IntradayTrader {
namespace Core {

using IntradayTrader::Logging::DataSyncLogs;

DataFreshnessTracker::DataFreshnessTracker(Logging::LoggingContext& logging_context_ref)
    : logging_context(logging_context_ref) {}

FreshnessResult DataFreshnessTracker::classify(Feed& feed, TimePoint now) const {
    double age_seconds = TimeUtils::seconds_between(feed.last_update_timestamp, now);
    double interval_seconds = static_cast<double>(feed.interval_seconds);

    if (age_seconds < interval_seconds) {
        DataSyncLogs::log_feed_up_to_date(logging_context, feed.name, age_seconds);
        return FreshnessResult::UP_TO_DATE;
    }

    if (!feed.data_grabber) {
        DataSyncLogs::log_fetch_failed(logging_context, feed.name, "no data grabber attached");
        return FreshnessResult::FETCH_ERROR;
    }

    HistoricalDataRequest data_request;
    data_request.symbol = feed.symbol;
    data_request.interval = feed.interval;
    data_request.period = feed.period;

    BarTable fetched_bars;
    try {
        DataSyncLogs::log_fetching_feed(logging_context, feed.name, feed.symbol, feed.interval, feed.period);
        fetched_bars = feed.data_grabber->fetch_historical(data_request);
    } catch (const std::exception& exception_error) {
        DataSyncLogs::log_fetch_failed(logging_context, feed.name, exception_error.what());
        return FreshnessResult::FETCH_ERROR;
    }

    if (fetched_bars.empty()) {
        DataSyncLogs::log_fetch_empty(logging_context, feed.name);
        return FreshnessResult::FETCH_ERROR;
    }

    auto newest_bar_iterator = std::max_element(fetched_bars.begin(), fetched_bars.end(),
        [](const Bar& left_bar, const Bar& right_bar) { return left_bar.timestamp < right_bar.timestamp; });
    feed.last_update_timestamp = newest_bar_iterator->timestamp;
    feed.data = std::move(fetched_bars);

    double refreshed_age_seconds = TimeUtils::seconds_between(feed.last_update_timestamp, now);
    return classify_age(feed, refreshed_age_seconds);
}

FreshnessResult DataFreshnessTracker::classify_age(const Feed& feed, double age_seconds) const {
    double interval_seconds = static_cast<double>(feed.interval_seconds);
    std::string latest_time_text = TimeUtils::format_utc_time(feed.last_update_timestamp);

    if (age_seconds < interval_seconds) {
        DataSyncLogs::log_feed_updated(logging_context, feed.name, latest_time_text, feed.data.size());
        return FreshnessResult::UPDATED;
    }
    if (age_seconds < 2.0 * interval_seconds) {
        DataSyncLogs::log_feed_late(logging_context, feed.name, latest_time_text);
        return FreshnessResult::UPDATED_BUT_LATE;
    }
    DataSyncLogs::log_feed_stale(logging_context, feed.name, latest_time_text);
    return FreshnessResult::STALE;
}

} // namespace Core
} // namespace IntradayTrader
