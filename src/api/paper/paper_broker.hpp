#ifndef PAPER_BROKER_HPP
#define PAPER_BROKER_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "api/general/broker_interface.hpp"
#include "api/general/data_grabber_interface.hpp"
#include "configs/broker_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/clock_source.hpp"

namespace IntradayTrader {
namespace API {

/**
 * @brief In-memory simulated account.
 *
 * Market orders fill immediately at the latest close reported by the price grabber.
 * Other order types rest open until cancelled. Statuses use the Alpaca vocabulary.
 */
class PaperBroker : public BrokerInterface {
public:
    PaperBroker(const BrokerConfig& broker_config_param, std::shared_ptr<DataGrabberInterface> price_grabber_param,
                Core::ClockSource& clock_source_ref, Logging::LoggingContext& logging_context_ref);

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

    bool is_started() const;

private:
    struct PaperOrder {
        Core::OrderRequest request;
        std::string status;
        double filled_price;

        PaperOrder() : filled_price(0.0) {}
    };

    BrokerConfig broker_config;
    std::shared_ptr<DataGrabberInterface> price_grabber;
    Core::ClockSource& clock_source;
    Logging::LoggingContext& logging_context;
    bool started;
    double cash_balance;
    unsigned long next_order_number;
    Core::PositionMap positions;
    std::map<std::string, PaperOrder> orders;

    void ensure_started(const std::string& operation_name) const;
    std::string generate_order_id();
    double fetch_latest_price(const std::string& symbol);
    void apply_fill(const Core::OrderRequest& order_request, double fill_price);
};

} // namespace API
} // namespace IntradayTrader

#endif // PAPER_BROKER_HPP
