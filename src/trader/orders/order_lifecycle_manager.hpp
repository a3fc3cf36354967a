#ifndef ORDER_LIFECYCLE_MANAGER_HPP
#define ORDER_LIFECYCLE_MANAGER_HPP

#include <map>
#include <set>
#include <string>
#include <vector>
#include "api/general/broker_interface.hpp"
#include "configs/timing_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/orders/order_status_mapping.hpp"
#include "utils/clock_source.hpp"

namespace IntradayTrader {
namespace Core {

/**
 * @brief Turns strategy instructions into broker orders and answers state queries.
 *
 * The broker stays the source of truth for every query. The local journal only remembers
 * which instruction produced which order id, and the last state observed for it.
 */
class OrderLifecycleManager {
public:
    OrderLifecycleManager(API::BrokerInterface& broker_ref, OrderStatusMapping status_mapping_param,
                          ClockSource& clock_source_ref, const TimingConfig& timing_config_param,
                          Logging::LoggingContext& logging_context_ref);

    // Throws InvalidOrder, InvalidInstrumentFormat, UnknownTradeType or ConnectionError
    std::string submit(const OrderInstruction& order_instruction);

    // Throws OrderNotFound when the broker has no record of the order
    OrderState status(const std::string& order_id);

    // Empty set cancels every open order; returns the ids actually cancelled
    std::vector<std::string> cancel(const std::set<std::string>& order_ids);

    bool is_pending(const std::string& order_id);
    bool is_submitted(const std::string& order_id);
    bool is_filled(const std::string& order_id);
    bool is_cancelled(const std::string& order_id);

    double get_filled_price(const std::string& order_id) const;

    // Empty set flattens every holding; returns the ids of the closing orders
    std::vector<std::string> close_position(const std::set<std::string>& symbols);

    const std::map<std::string, OrderRecord>& get_order_journal() const;

private:
    API::BrokerInterface& broker;
    OrderStatusMapping status_mapping;
    ClockSource& clock_source;
    const TimingConfig& timing_config;
    Logging::LoggingContext& logging_context;
    std::map<std::string, OrderRecord> order_journal;

    OrderRequest build_order_request(const OrderInstruction& order_instruction, const Instrument& instrument) const;
    void validate_prices(const OrderInstruction& order_instruction) const;
    bool state_matches(const std::string& order_id, OrderState expected_state, const std::string& operation_name);
};

} // namespace Core
} // namespace IntradayTrader

#endif // ORDER_LIFECYCLE_MANAGER_HPP
