#include "data_sync_coordinator.hpp"
#include "logging/logs/data_sync_logs.hpp"
#include "trader/errors/trading_errors.hpp"
#include <algorithm>

namespace IntradayTrader {
namespace Core {

using IntradayTrader::Logging::DataSyncLogs;

namespace {

bool is_retryable(FreshnessResult freshness_result) {
    return freshness_result == FreshnessResult::FETCH_ERROR || freshness_result == FreshnessResult::UPDATED_BUT_LATE;
}

bool all_results_equal(const std::vector<FreshnessResult>& feed_results, FreshnessResult expected_result) {
    return std::all_of(feed_results.begin(), feed_results.end(),
                       [expected_result](FreshnessResult feed_result) { return feed_result == expected_result; });
}

bool any_result_equal(const std::vector<FreshnessResult>& feed_results, FreshnessResult expected_result) {
    return std::any_of(feed_results.begin(), feed_results.end(),
                       [expected_result](FreshnessResult feed_result) { return feed_result == expected_result; });
}

} // anonymous namespace

DataSyncCoordinator::DataSyncCoordinator(ClockSource& clock_source_ref, const TimingConfig& timing_config_param,
                                         Logging::LoggingContext& logging_context_ref)
    : clock_source(clock_source_ref), timing_config(timing_config_param),
      logging_context(logging_context_ref), freshness_tracker(logging_context_ref) {}

void DataSyncCoordinator::add_feed(Feed feed) {
    feeds.push_back(std::move(feed));
}

size_t DataSyncCoordinator::feed_count() const {
    return feeds.size();
}

const std::vector<Feed>& DataSyncCoordinator::get_feeds() const {
    return feeds;
}

SyncOutcome DataSyncCoordinator::sync_tick(TimePoint now) {
    if (feeds.empty()) {
        throw SetupError("no feeds registered with the data sync coordinator");
    }

    std::vector<FreshnessResult> feed_results;
    feed_results.reserve(feeds.size());
    for (Feed& feed : feeds) {
        feed_results.push_back(freshness_tracker.classify(feed, now));
    }

    int retry_round = 0;
    const int max_retry_rounds = timing_config.data_sync_max_retry_rounds;
    while (!any_result_equal(feed_results, FreshnessResult::STALE) &&
           std::any_of(feed_results.begin(), feed_results.end(), is_retryable)) {
        std::vector<std::string> retry_feed_names;
        for (size_t feed_index = 0; feed_index < feeds.size(); ++feed_index) {
            if (is_retryable(feed_results[feed_index])) {
                retry_feed_names.push_back(feeds[feed_index].name);
            }
        }

        if (retry_round >= max_retry_rounds) {
            DataSyncLogs::log_retry_exhausted(logging_context, max_retry_rounds, retry_feed_names);
            SyncOutcome retry_outcome = build_outcome(feed_results);
            retry_outcome.kind = SyncOutcomeKind::NEEDS_RETRY;
            retry_outcome.recommended_delay = std::chrono::milliseconds(timing_config.data_sync_retry_backoff_milliseconds);
            DataSyncLogs::log_sync_outcome(logging_context, retry_outcome);
            return retry_outcome;
        }

        ++retry_round;
        DataSyncLogs::log_retry_round(logging_context, retry_round, max_retry_rounds, retry_feed_names);
        clock_source.sleep_for(std::chrono::milliseconds(timing_config.data_sync_retry_backoff_milliseconds));

        TimePoint retry_time = clock_source.now();
        for (size_t feed_index = 0; feed_index < feeds.size(); ++feed_index) {
            if (is_retryable(feed_results[feed_index])) {
                feed_results[feed_index] = freshness_tracker.classify(feeds[feed_index], retry_time);
            }
        }
    }

    SyncOutcome sync_outcome = build_outcome(feed_results);
    DataSyncLogs::log_sync_outcome(logging_context, sync_outcome);
    return sync_outcome;
}

SyncOutcome DataSyncCoordinator::build_outcome(const std::vector<FreshnessResult>& feed_results) const {
    SyncOutcome sync_outcome;
    for (size_t feed_index = 0; feed_index < feeds.size(); ++feed_index) {
        sync_outcome.feed_results[feeds[feed_index].name] = feed_results[feed_index];
        if (feed_results[feed_index] == FreshnessResult::STALE) {
            sync_outcome.stale_feeds.push_back(feeds[feed_index].name);
        }
    }

    if (!sync_outcome.stale_feeds.empty()) {
        sync_outcome.kind = SyncOutcomeKind::ABORT;
        sync_outcome.recommended_delay = std::chrono::seconds(timing_config.stale_data_backoff_seconds);
    } else if (all_results_equal(feed_results, FreshnessResult::UP_TO_DATE)) {
        sync_outcome.kind = SyncOutcomeKind::ALL_UP_TO_DATE;
    } else {
        // Every feed is UP_TO_DATE or UPDATED at this point
        sync_outcome.kind = SyncOutcomeKind::ALL_FRESH;
    }
    return sync_outcome;
}

void DataSyncCoordinator::initial_load(TimePoint now) {
    for (Feed& feed : feeds) {
        FreshnessResult freshness_result = freshness_tracker.classify(feed, now);
        DataSyncLogs::log_initial_load(logging_context, feed.name, freshness_result);
    }
}

FeedDataMap DataSyncCoordinator::get_feed_data() const {
    FeedDataMap feed_data;
    for (const Feed& feed : feeds) {
        feed_data[feed.name] = feed.data;
    }
    return feed_data;
}

} // namespace Core
} // namespace IntradayTrader
