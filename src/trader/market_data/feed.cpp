#include "feed.hpp"
#include "trader/errors/trading_errors.hpp"
#include "utils/time_utils.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace IntradayTrader {
namespace Core {

long long interval_to_seconds(const std::string& interval_text) {
    if (interval_text.size() < 2) {
        throw InvalidIntervalFormat(interval_text);
    }

    char unit_character = interval_text.back();
    std::string count_text = interval_text.substr(0, interval_text.size() - 1);
    for (char count_character : count_text) {
        if (!std::isdigit(static_cast<unsigned char>(count_character))) {
            throw InvalidIntervalFormat(interval_text);
        }
    }

    long long interval_count = 0;
    try {
        interval_count = std::stoll(count_text);
    } catch (const std::out_of_range&) {
        throw InvalidIntervalFormat(interval_text);
    }

    long long unit_seconds = 0;
    switch (unit_character) {
        case 's': unit_seconds = 1; break;
        case 'm': unit_seconds = TimeUtils::SECONDS_PER_MINUTE; break;
        case 'h': unit_seconds = TimeUtils::SECONDS_PER_HOUR; break;
        case 'd': unit_seconds = TimeUtils::SECONDS_PER_DAY; break;
        case 'w': unit_seconds = TimeUtils::SECONDS_PER_WEEK; break;
        case 'M': unit_seconds = TimeUtils::SECONDS_PER_MONTH; break;
        case 'y': unit_seconds = TimeUtils::SECONDS_PER_YEAR; break;
        default:
            throw InvalidIntervalFormat(interval_text);
    }

    // A zero interval would grade every fetch as stale
    if (interval_count == 0 || interval_count > std::numeric_limits<long long>::max() / unit_seconds) {
        throw InvalidIntervalFormat(interval_text);
    }
    return interval_count * unit_seconds;
}

TimePoint initial_feed_timestamp() {
    return TimeUtils::make_utc_time_point(1990, 1, 1, 0, 0, 0);
}

Feed make_feed(const FeedConfig& feed_config, std::shared_ptr<API::DataGrabberInterface> data_grabber) {
    Feed configured_feed;
    configured_feed.name = feed_config.name.empty() ? feed_config.symbol : feed_config.name;
    configured_feed.symbol = feed_config.symbol;
    configured_feed.interval = feed_config.interval;
    configured_feed.period = feed_config.period;
    configured_feed.interval_seconds = interval_to_seconds(feed_config.interval);
    configured_feed.last_update_timestamp = initial_feed_timestamp();
    configured_feed.data_grabber = std::move(data_grabber);
    return configured_feed;
}

} // namespace Core
} // namespace IntradayTrader
