#ifndef STARTUP_LOGS_HPP
#define STARTUP_LOGS_HPP

#include "configs/system_config.hpp"

/**
 * Specialized logging for application startup sequence.
 * Handles all startup-related logging in a consistent format.
 */
class StartupLogs {
public:
    static void log_application_header();
    static void log_broker_configuration(const IntradayTrader::Config::SystemConfig& config);
    static void log_feed_configuration(const IntradayTrader::Config::SystemConfig& config);
    static void log_runtime_configuration(const IntradayTrader::Config::SystemConfig& config);
    static void log_strategy_configuration(const IntradayTrader::Config::SystemConfig& config);
};

#endif // STARTUP_LOGS_HPP
