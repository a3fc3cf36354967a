#ifndef STRATEGY_INTERFACE_HPP
#define STRATEGY_INTERFACE_HPP

#include <string>
#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace IntradayTrader {
namespace Core {

/**
 * Turns the latest feed tables into an ordered list of order instructions.
 * An empty list means no action this tick.
 */
class StrategyInterface {
public:
    virtual ~StrategyInterface() = default;

    virtual std::vector<OrderInstruction> decide(const FeedDataMap& feed_data) = 0;
    virtual std::string get_strategy_name() const = 0;
};

} // namespace Core
} // namespace IntradayTrader

#endif // STRATEGY_INTERFACE_HPP
