#ifndef MOCK_STRATEGY_HPP
#define MOCK_STRATEGY_HPP

#include <gmock/gmock.h>
#include "trader/strategy_analysis/strategy_interface.hpp"

namespace IntradayTrader {
namespace Tests {

class MockStrategy : public Core::StrategyInterface {
public:
    MOCK_METHOD(std::vector<Core::OrderInstruction>, decide, (const Core::FeedDataMap& feed_data), (override));
    MOCK_METHOD(std::string, get_strategy_name, (), (const, override));
};

} // namespace Tests
} // namespace IntradayTrader

#endif // MOCK_STRATEGY_HPP
