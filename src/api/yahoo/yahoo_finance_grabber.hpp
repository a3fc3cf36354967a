#ifndef YAHOO_FINANCE_GRABBER_HPP
#define YAHOO_FINANCE_GRABBER_HPP

#include <string>
#include "api/general/data_grabber_interface.hpp"
#include "configs/data_config.hpp"
#include "utils/connectivity_manager.hpp"

namespace IntradayTrader {
namespace API {

/**
 * @brief Historical bars from the Yahoo Finance chart endpoint.
 *
 * Intraday intervals are capped by the provider; a "max" period is replaced with the
 * longest window the provider serves for that interval.
 */
class YahooFinanceGrabber : public DataGrabberInterface {
public:
    YahooFinanceGrabber(const DataConfig& data_config_param, ConnectivityManager& connectivity_manager_ref);

    // Throws ConnectionError on transport or HTTP failure, std::runtime_error on a malformed body
    Core::BarTable fetch_historical(const Core::HistoricalDataRequest& request) override;
    std::string get_provider_name() const override;

    static std::string resolve_period(const std::string& interval, const std::string& period);
    static Core::BarTable parse_chart_response(const std::string& response_body);

private:
    DataConfig data_config;
    ConnectivityManager& connectivity_manager;

    std::string build_chart_url(const Core::HistoricalDataRequest& request) const;
};

} // namespace API
} // namespace IntradayTrader

#endif // YAHOO_FINANCE_GRABBER_HPP
