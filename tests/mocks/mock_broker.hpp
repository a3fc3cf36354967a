#ifndef MOCK_BROKER_HPP
#define MOCK_BROKER_HPP

#include <gmock/gmock.h>
#include "api/general/broker_interface.hpp"

namespace IntradayTrader {
namespace Tests {

class MockBroker : public API::BrokerInterface {
public:
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(Core::TimePoint, now, (), (const, override));
    MOCK_METHOD(double, get_cash, (), (const, override));
    MOCK_METHOD(Core::PositionMap, get_positions, (const std::vector<std::string>& symbols), (const, override));
    MOCK_METHOD(Core::OrderPlacementResult, place_order, (const Core::OrderRequest& order_request), (override));
    MOCK_METHOD(void, cancel_order, (const std::string& order_id), (override));
    MOCK_METHOD(std::optional<std::string>, get_order_status, (const std::string& order_id), (const, override));
    MOCK_METHOD(std::vector<Core::OpenOrder>, get_open_orders, (), (const, override));
    MOCK_METHOD(double, get_filled_price, (const std::string& order_id), (const, override));
    MOCK_METHOD(API::BrokerStatusVocabulary, get_status_vocabulary, (), (const, override));
    MOCK_METHOD(std::string, get_broker_name, (), (const, override));
};

} // namespace Tests
} // namespace IntradayTrader

#endif // MOCK_BROKER_HPP
