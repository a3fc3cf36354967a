#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <memory>
#include "system/system_modules.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/clock_source.hpp"
#include "utils/connectivity_manager.hpp"

/**
 * @brief Central system state container
 *
 * Owns the configuration, the shutdown flags and every runtime module.
 */
struct SystemState {
    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> running{true};              // Cleared by the signal handler to stop the loop
    std::atomic<bool> shutdown_requested{false};  // Set once a shutdown signal arrived

    // =========================================================================
    // CONFIGURATION AND MODULES
    // =========================================================================
    IntradayTrader::Config::SystemConfig config;                    // Complete system configuration
    IntradayTrader::Core::SystemClockSource clock_source;           // Wall clock used by every module
    ConnectivityManager market_data_connectivity;                   // Health of the market data provider
    ConnectivityManager broker_connectivity;                        // Health of the REST broker
    std::shared_ptr<IntradayTrader::Logging::LoggingContext> logging_context;
    std::unique_ptr<SystemModules> trading_modules;

    explicit SystemState(const IntradayTrader::Config::SystemConfig& initial)
        : config(initial),
          market_data_connectivity("market_data", config.data.connectivity, clock_source),
          broker_connectivity("broker", config.broker.connectivity, clock_source) {}
};

#endif // SYSTEM_STATE_HPP
