// DataConfig.hpp
#ifndef DATA_CONFIG_HPP
#define DATA_CONFIG_HPP

#include <string>
#include <vector>
#include "connectivity_config.hpp"

struct FeedConfig {
    std::string name;                                // Key under which the strategy sees the table
    std::string symbol;                              // Provider ticker
    std::string interval;                            // Bar interval (<int><unit>)
    std::string period = "max";                      // History window requested per fetch
};

struct DataConfig {
    std::vector<FeedConfig> feeds;

    // Market data provider
    std::string provider_base_url = "https://query1.finance.yahoo.com";
    std::string chart_endpoint = "/v8/finance/chart/{symbol}";
    int retry_count = 3;                             // HTTP retries per fetch
    int timeout_seconds = 10;                        // HTTP timeout per fetch
    bool enable_ssl_verification = true;
    int rate_limit_delay_ms = 100;                   // Delay between HTTP retries
    ConnectivityPolicy connectivity;                 // Health tracking for provider requests
};

#endif // DATA_CONFIG_HPP
