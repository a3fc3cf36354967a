#ifndef BROKER_INTERFACE_HPP
#define BROKER_INTERFACE_HPP

#include <optional>
#include <string>
#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace IntradayTrader {
namespace API {

// Which broker-native status strings a broker reports
enum class BrokerStatusVocabulary {
    INTERACTIVE_BROKERS,
    SCHWAB,
    ALPACA
};

/**
 * Brokerage account capability consumed by the trading core.
 * The broker is always the source of truth; callers re-read it on demand.
 */
class BrokerInterface {
public:
    virtual ~BrokerInterface() = default;

    // Connection lifecycle; start throws ConnectionError when the broker is unreachable
    virtual void start() = 0;
    virtual void stop() = 0;

    virtual Core::TimePoint now() const = 0;
    virtual double get_cash() const = 0;

    // Empty symbol list returns every holding
    virtual Core::PositionMap get_positions(const std::vector<std::string>& symbols) const = 0;

    // Throws UnknownTradeType or ConnectionError; a soft rejection comes back as a non-zero error_code
    virtual Core::OrderPlacementResult place_order(const Core::OrderRequest& order_request) = 0;
    virtual void cancel_order(const std::string& order_id) = 0;

    // Broker-native status string, std::nullopt when the broker has no record of the order
    virtual std::optional<std::string> get_order_status(const std::string& order_id) const = 0;
    virtual std::vector<Core::OpenOrder> get_open_orders() const = 0;
    virtual double get_filled_price(const std::string& order_id) const = 0;

    virtual BrokerStatusVocabulary get_status_vocabulary() const = 0;
    virtual std::string get_broker_name() const = 0;
};

} // namespace API
} // namespace IntradayTrader

#endif // BROKER_INTERFACE_HPP
