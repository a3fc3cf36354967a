#ifndef FEED_HPP
#define FEED_HPP

#include <memory>
#include <string>
#include "api/general/data_grabber_interface.hpp"
#include "configs/data_config.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace IntradayTrader {
namespace Core {

// One (symbol, interval, period) subscription and the last table fetched for it
struct Feed {
    std::string name;
    std::string symbol;
    std::string interval;
    std::string period;
    long long interval_seconds;
    TimePoint last_update_timestamp;
    BarTable data;
    std::shared_ptr<API::DataGrabberInterface> data_grabber;

    Feed() : interval_seconds(0) {}
};

// <integer><unit> with unit in s, m, h, d, w, M (30 days), y (365 days); throws InvalidIntervalFormat
long long interval_to_seconds(const std::string& interval_text);

// Instant every feed starts from so the first classification always fetches
TimePoint initial_feed_timestamp();

Feed make_feed(const FeedConfig& feed_config, std::shared_ptr<API::DataGrabberInterface> data_grabber);

} // namespace Core
} // namespace IntradayTrader

#endif // FEED_HPP
