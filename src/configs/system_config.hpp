#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "strategy_config.hpp"
#include "timing_config.hpp"
#include "logging_config.hpp"
#include "orders_config.hpp"
#include "data_config.hpp"
#include "broker_config.hpp"

namespace IntradayTrader {
namespace Config {

/**
 * Main trading system configuration.
 * Timing config includes loop cadence, sync backoff, end of day and broker connection.
 * Connectivity policies live with the data and broker configs they guard.
 */
struct SystemConfig {
    SystemConfig() {}

    StrategyConfig strategy;           // Example strategy parameters
    TimingConfig timing;               // All timing, backoff and polling intervals
    LoggingConfig logging;             // Logging configuration
    OrdersConfig orders;               // Tracked instruments
    DataConfig data;                   // Feeds and market data provider
    BrokerConfig broker;               // Broker selection and connection
};

} // namespace Config
} // namespace IntradayTrader

#endif // SYSTEM_CONFIG_HPP
