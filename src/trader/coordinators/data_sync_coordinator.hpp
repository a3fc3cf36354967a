#ifndef DATA_SYNC_COORDINATOR_HPP
#define DATA_SYNC_COORDINATOR_HPP

#include <chrono>
#include <string>
#include <vector>
#include "configs/timing_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/market_data/data_freshness_tracker.hpp"
#include "trader/market_data/feed.hpp"
#include "utils/clock_source.hpp"

namespace IntradayTrader {
namespace Core {

/**
 * @brief Brings every registered feed to a consistent freshness tier before a tick may trade.
 *
 * Lagging feeds (FETCH_ERROR, UPDATED_BUT_LATE) are reclassified after a short backoff
 * for a bounded number of rounds. One STALE feed aborts the whole tick.
 */
class DataSyncCoordinator {
public:
    DataSyncCoordinator(ClockSource& clock_source_ref, const TimingConfig& timing_config_param,
                        Logging::LoggingContext& logging_context_ref);

    void add_feed(Feed feed);
    size_t feed_count() const;
    const std::vector<Feed>& get_feeds() const;

    SyncOutcome sync_tick(TimePoint now);

    // Classifies every feed once at start-up so the strategy has data before the first window
    void initial_load(TimePoint now);

    // Cached table per feed name, as last fetched
    FeedDataMap get_feed_data() const;

private:
    ClockSource& clock_source;
    const TimingConfig& timing_config;
    Logging::LoggingContext& logging_context;
    DataFreshnessTracker freshness_tracker;
    std::vector<Feed> feeds;

    SyncOutcome build_outcome(const std::vector<FreshnessResult>& feed_results) const;
};

} // namespace Core
} // namespace IntradayTrader

#endif // DATA_SYNC_COORDINATOR_HPP
