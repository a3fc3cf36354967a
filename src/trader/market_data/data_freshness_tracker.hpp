#ifndef DATA_FRESHNESS_TRACKER_HPP
#define DATA_FRESHNESS_TRACKER_HPP

#include "logging/logger/async_logger.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/market_data/feed.hpp"

namespace IntradayTrader {
namespace Core {

/**
 * @brief Classifies one feed's freshness at a reference instant.
 *
 * A feed whose interval has not elapsed since its last update is UP_TO_DATE and
 * is not fetched. Otherwise the feed's grabber is queried; the newest bar decides
 * between UPDATED, UPDATED_BUT_LATE (one to two intervals old) and STALE.
 * Empty or failed fetches leave the feed untouched and yield FETCH_ERROR.
 */
class DataFreshnessTracker {
public:
    explicit DataFreshnessTracker(Logging::LoggingContext& logging_context_ref);

    FreshnessResult classify(Feed& feed, TimePoint now) const;

private:
    Logging::LoggingContext& logging_context;

    FreshnessResult classify_age(const Feed& feed, double age_seconds) const;
};

} // namespace Core
} // namespace IntradayTrader

#endif // DATA_FRESHNESS_TRACKER_HPP
