// BrokerConfig.hpp
#ifndef BROKER_CONFIG_HPP
#define BROKER_CONFIG_HPP

#include <string>
#include "connectivity_config.hpp"

struct BrokerEndpointsConfig {
    std::string account = "/v2/account";
    std::string positions = "/v2/positions";
    std::string orders = "/v2/orders";
    std::string clock = "/v2/clock";
};

struct BrokerConfig {
    std::string mode = "paper";                      // paper or alpaca
    std::string currency = "USD";                    // Account currency for positions

    // REST broker connection
    std::string base_url = "https://paper-api.alpaca.markets";
    std::string api_key;                             // Overridden by INTRADAY_BROKER_API_KEY
    std::string api_secret;                          // Overridden by INTRADAY_BROKER_API_SECRET
    BrokerEndpointsConfig endpoints;
    int retry_count = 3;
    int timeout_seconds = 30;
    bool enable_ssl_verification = true;
    int rate_limit_delay_ms = 100;                   // Delay between HTTP retries on reads
    ConnectivityPolicy connectivity;                 // Health tracking for broker requests

    // Simulated broker
    double paper_starting_cash = 100000.0;
    std::string paper_price_interval = "1m";         // Bar interval used to price market orders
    std::string paper_price_period = "1d";
};

#endif // BROKER_CONFIG_HPP
