#ifndef ORDER_STATUS_MAPPING_HPP
#define ORDER_STATUS_MAPPING_HPP

#include <string>
#include <unordered_map>
#include <unordered_set>
#include "api/general/broker_interface.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace IntradayTrader {
namespace Core {

/**
 * @brief Explicit table from broker-native status strings to canonical OrderState.
 *
 * Lookup is total: any string missing from the table maps to UNKNOWN.
 * Provisional strings (a cancel the broker has not confirmed yet) map to a terminal
 * state but may still be followed by a different outcome, e.g. a fill.
 */
class OrderStatusMapping {
public:
    OrderStatusMapping(API::BrokerStatusVocabulary vocabulary_value,
                       std::unordered_map<std::string, OrderState> status_table_value,
                       std::unordered_set<std::string> provisional_statuses_value = {});

    OrderState map_status(const std::string& broker_status) const;
    bool is_known_status(const std::string& broker_status) const;
    bool is_provisional_status(const std::string& broker_status) const;
    API::BrokerStatusVocabulary get_vocabulary() const;
    size_t size() const;

private:
    API::BrokerStatusVocabulary vocabulary;
    std::unordered_map<std::string, OrderState> status_table;
    std::unordered_set<std::string> provisional_statuses;
};

OrderStatusMapping make_interactive_brokers_status_mapping();
OrderStatusMapping make_schwab_status_mapping();
OrderStatusMapping make_alpaca_status_mapping();
OrderStatusMapping make_order_status_mapping(API::BrokerStatusVocabulary vocabulary);

} // namespace Core
} // namespace IntradayTrader

#endif // ORDER_STATUS_MAPPING_HPP
