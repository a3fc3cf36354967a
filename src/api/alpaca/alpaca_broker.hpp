#ifndef ALPACA_BROKER_HPP
#define ALPACA_BROKER_HPP

#include <string>
#include <vector>
#include "api/general/broker_interface.hpp"
#include "configs/broker_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/connectivity_manager.hpp"
#include "utils/http_utils.hpp"

namespace IntradayTrader {
namespace API {

/**
 * @brief Brokerage account on the Alpaca trading REST API.
 *
 * Only SPOT equities are tradable. Every query goes to the API; nothing is cached.
 */
class AlpacaBroker : public BrokerInterface {
public:
    AlpacaBroker(const BrokerConfig& broker_config_param, ConnectivityManager& connectivity_manager_ref,
                 Logging::LoggingContext& logging_context_ref);
    ~AlpacaBroker() override;

    // Throws SetupError on missing credentials, ConnectionError when the account cannot be read
    void start() override;
    void stop() override;

    Core::TimePoint now() const override;
    double get_cash() const override;
    Core::PositionMap get_positions(const std::vector<std::string>& symbols) const override;

    Core::OrderPlacementResult place_order(const Core::OrderRequest& order_request) override;
    void cancel_order(const std::string& order_id) override;
    std::optional<std::string> get_order_status(const std::string& order_id) const override;
    std::vector<Core::OpenOrder> get_open_orders() const override;
    double get_filled_price(const std::string& order_id) const override;

    BrokerStatusVocabulary get_status_vocabulary() const override;
    std::string get_broker_name() const override;

    // Request body for POST /v2/orders; throws UnknownTradeType or InvalidOrder
    static std::string build_order_body(const Core::OrderRequest& order_request);

    // Authenticated request; only GET carries the configured retry count
    HttpRequest build_authenticated_request(const std::string& request_url, const std::string& method,
                                            const std::string& request_body) const;

private:
    BrokerConfig broker_config;
    ConnectivityManager& connectivity_manager;
    Logging::LoggingContext& logging_context;
    bool connected;

    HttpResponse make_authenticated_request(const std::string& request_url, const std::string& method,
                                            const std::string& request_body) const;
    std::string build_url(const std::string& endpoint) const;
    void ensure_connected(const std::string& operation_name) const;
};

} // namespace API
} // namespace IntradayTrader

#endif // ALPACA_BROKER_HPP
